/**
 * @file test_network_capture.cpp
 * @brief Unit tests for DevTools event correlation
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/network_capture.h"
#include "helpers/fake_browser.h"

using nlohmann::json;
using test_helpers::request_event;
using test_helpers::response_event;

TEST_CASE("Requests and responses are correlated by id", "[capture]") {
    std::vector<RawEvent> events = {
        request_event("1", "get", "https://shop.test/", 10.0),
        request_event("2", "POST", "https://shop.test/api/auth/login", 11.5,
                      R"({"email":"a@b.test","password":"x"})",
                      {{"Content-Type", "application/json"}}),
        response_event("2", 200, {{"Set-Cookie", "sid=abc; Path=/\nlang=en"}}),
        {{"method", "Network.dataReceived"}, {"params", {{"requestId", "2"}}}},
        {{"method", "Network.loadingFailed"}, {"params", {{"requestId", "1"}}}}
    };

    CaptureLog log = NetworkCapture::parse(events);
    REQUIRE(log.requests.size() == 2);
    REQUIRE(log.requests[0].method == "GET");
    REQUIRE(log.requests[0].sequence == 0);
    REQUIRE_FALSE(log.requests[0].body.has_value());

    const auto& login = log.requests[1];
    REQUIRE(login.id == "2");
    REQUIRE(login.body.value() == R"({"email":"a@b.test","password":"x"})");
    REQUIRE(login.timestamp == Approx(11.5));
    REQUIRE(login.resource_type == "XHR");
    REQUIRE(NetworkCapture::header_value(login.headers, "content-type") == "application/json");

    REQUIRE(log.response_for("1") == nullptr);
    const CapturedResponse* resp = log.response_for("2");
    REQUIRE(resp != nullptr);
    REQUIRE(resp->status == 200);
    REQUIRE(resp->mime_type == "application/json");
    REQUIRE(resp->set_cookies == std::vector<std::string>{"sid=abc; Path=/", "lang=en"});

    REQUIRE(log.failed.count("1") == 1);
    REQUIRE(log.ignored_events == 1);
    REQUIRE(log.request_for("2") == &log.requests[1]);
    REQUIRE(log.request_for("9") == nullptr);
}

TEST_CASE("Redirect hops keep their own records", "[capture]") {
    json redirect = request_event("7", "POST", "https://shop.test/api/session", 5.0, "u=a&p=b");
    json followed = request_event("7", "GET", "https://shop.test/account", 5.2);
    followed["params"]["redirectResponse"] = {
        {"status", 302},
        {"headers", {{"Location", "/account"}, {"Set-Cookie", "sid=s1; HttpOnly"}}}
    };

    CaptureLog log = NetworkCapture::parse({redirect, followed, response_event("7", 200, json::object(), "text/html")});

    REQUIRE(log.requests.size() == 2);
    REQUIRE(log.requests[0].id == "7.r1");
    REQUIRE(log.requests[0].method == "POST");
    REQUIRE(log.requests[1].id == "7");
    REQUIRE(log.requests[1].method == "GET");

    const CapturedResponse* hop = log.response_for("7.r1");
    REQUIRE(hop != nullptr);
    REQUIRE(hop->status == 302);
    REQUIRE(hop->set_cookies.size() == 1);
    REQUIRE(log.response_for("7")->status == 200);
    REQUIRE(log.response_for("7")->mime_type == "text/html");
}

TEST_CASE("ExtraInfo events merge headers", "[capture]") {
    SECTION("ExtraInfo after the request") {
        CaptureLog log = NetworkCapture::parse({
            request_event("3", "POST", "https://shop.test/login", 1.0, "x=1"),
            {{"method", "Network.requestWillBeSentExtraInfo"},
             {"params", {{"requestId", "3"}, {"headers", {{"Cookie", "pre=1"}}}}}}
        });
        REQUIRE(log.requests[0].headers.at("Cookie") == "pre=1");
    }

    SECTION("ExtraInfo before the request") {
        CaptureLog log = NetworkCapture::parse({
            {{"method", "Network.requestWillBeSentExtraInfo"},
             {"params", {{"requestId", "3"}, {"headers", {{"Cookie", "early=1"}}}}}},
            request_event("3", "POST", "https://shop.test/login", 1.0, "x=1")
        });
        REQUIRE(log.requests.size() == 1);
        REQUIRE(log.requests[0].headers.at("Cookie") == "early=1");
    }

    SECTION("Response ExtraInfo supplies raw Set-Cookie") {
        CaptureLog log = NetworkCapture::parse({
            request_event("4", "POST", "https://shop.test/login", 1.0, "x=1"),
            {{"method", "Network.responseReceivedExtraInfo"},
             {"params", {{"requestId", "4"}, {"statusCode", 200},
                         {"headers", {{"set-cookie", "token=t1\nrefresh=r1"}}}}}}
        });
        const CapturedResponse* resp = log.response_for("4");
        REQUIRE(resp != nullptr);
        REQUIRE(resp->status == 200);
        REQUIRE(resp->set_cookies.size() == 2);
    }
}

TEST_CASE("Mistyped events are skipped", "[capture]") {
    std::vector<RawEvent> events = {
        {{"method", "Network.requestWillBeSent"}, {"params", {{"requestId", 1}}}},
        {{"method", "Network.requestWillBeSent"}, {"params", "not an object"}},
        {{"method", "Network.requestWillBeSent"},
         {"params", {{"requestId", "2"}, {"request", {{"url", 42}, {"method", true}, {"headers", "x"}}}}}},
        {{"method", "Network.requestWillBeSent"}, {"params", {{"requestId", "3"}, {"request", json::array()}}}},
        {{"method", "Network.responseReceived"}, {"params", {{"requestId", "2"}, {"response", "gone"}}}},
        request_event("4", "POST", "https://shop.test/api/auth/login", 3.0)
    };

    CaptureLog log;
    REQUIRE_NOTHROW(log = NetworkCapture::parse(events));
    REQUIRE(log.ignored_events == 2);
    REQUIRE(log.requests.size() == 3);

    const CapturedRequest* odd = log.request_for("2");
    REQUIRE(odd != nullptr);
    REQUIRE(odd->url.empty());
    REQUIRE(odd->method == "GET");
    REQUIRE(odd->headers.empty());
    REQUIRE(log.response_for("2") != nullptr);
    REQUIRE(log.response_for("2")->status == 0);

    REQUIRE(log.request_for("4")->url == "https://shop.test/api/auth/login");
}

TEST_CASE("WebDriver performance log entries are unwrapped", "[capture]") {
    json inner = {{"message", request_event("5", "POST", "https://shop.test/signin", 2.0, "a=b")},
                  {"webview", "ABC"}};
    json entry = {{"level", "INFO"}, {"timestamp", 1700000000000LL}, {"message", inner.dump()}};

    auto msg = NetworkCapture::normalize_event(entry);
    REQUIRE(msg.has_value());
    REQUIRE((*msg)["method"] == "Network.requestWillBeSent");

    REQUIRE_FALSE(NetworkCapture::normalize_event(json{{"message", "{broken"}}).has_value());
    REQUIRE_FALSE(NetworkCapture::normalize_event(json::array()).has_value());

    CaptureLog log = NetworkCapture::parse({entry, json{{"message", "{broken"}}});
    REQUIRE(log.requests.size() == 1);
    REQUIRE(log.ignored_events == 1);
}

TEST_CASE("Saved capture files", "[capture]") {
    json events = json::array({request_event("1", "POST", "https://shop.test/login", 1.0, "a=b")});

    REQUIRE(NetworkCapture::parse_json(events).requests.size() == 1);
    REQUIRE(NetworkCapture::parse_json({{"events", events}}).requests.size() == 1);
    REQUIRE(NetworkCapture::parse_json(json::object()).requests.empty());
    REQUIRE(NetworkCapture::parse({}).requests.empty());
}
