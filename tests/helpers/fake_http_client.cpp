/**
 * @file fake_http_client.cpp
 * @brief Implementation of the scripted HttpClient
 */

#include "fake_http_client.h"
#include <algorithm>
#include <chrono>
#include <thread>

namespace test_helpers {

FakeRoute FakeRoute::status_only(long status) {
    FakeRoute r;
    r.status = status;
    return r;
}

FakeRoute FakeRoute::html(const std::string& body) {
    FakeRoute r;
    r.status = 200;
    r.body = body;
    r.headers = {{"Content-Type", "text/html; charset=utf-8"}};
    return r;
}

FakeRoute FakeRoute::json_body(long status, const std::string& body) {
    FakeRoute r;
    r.status = status;
    r.body = body;
    r.headers = {{"Content-Type", "application/json"}};
    return r;
}

FakeRoute FakeRoute::redirect_to(const std::string& final_url, long hops) {
    FakeRoute r;
    r.status = 200;
    r.body = "<html><body>landed</body></html>";
    r.effective_url = final_url;
    r.redirect_count = hops;
    return r;
}

FakeRoute FakeRoute::unreachable() {
    FakeRoute r;
    r.status = 0;
    r.transport_error = true;
    return r;
}

FakeHttpClient::FakeHttpClient() {
    fallback_ = FakeRoute::status_only(404);
}

void FakeHttpClient::on(const std::string& method, const std::string& url, const FakeRoute& route) {
    routes_[method + " " + url] = route;
}

void FakeHttpClient::set_fallback(const FakeRoute& route) {
    fallback_ = route;
}

bool FakeHttpClient::perform(const HttpRequest& req, HttpResponse& resp) const {
    {
        std::lock_guard<std::mutex> lock(mu_);
        calls_.push_back(req);
    }

    const FakeRoute* route = &fallback_;
    auto exact = routes_.find(req.method + " " + req.url);
    if (exact != routes_.end()) {
        route = &exact->second;
    } else {
        auto any = routes_.find("* " + req.url);
        if (any != routes_.end()) route = &any->second;
    }

    if (route->delay_ms > 0) {
        long limit_ms = req.timeout_seconds > 0 ? req.timeout_seconds * 1000 : route->delay_ms;
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(route->delay_ms, limit_ms)));
        if (route->delay_ms > limit_ms) {
            resp.error = "Operation timed out";
            return false;
        }
    }

    if (route->transport_error) {
        resp.error = "Couldn't connect to server";
        return false;
    }

    resp.status = route->status;
    resp.body = route->body;
    resp.body_bytes = route->body.size();
    resp.headers = route->headers;
    resp.effective_url = route->effective_url.empty() ? req.url : route->effective_url;
    resp.redirect_count = route->redirect_count;
    return true;
}

std::vector<HttpRequest> FakeHttpClient::calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
}

size_t FakeHttpClient::count(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<size_t>(std::count_if(calls_.begin(), calls_.end(),
        [&url](const HttpRequest& r) { return r.url == url; }));
}

std::vector<HttpRequest> FakeHttpClient::calls_with_method(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<HttpRequest> out;
    for (const auto& r : calls_) {
        if (r.method == method) out.push_back(r);
    }
    return out;
}

} // namespace test_helpers
