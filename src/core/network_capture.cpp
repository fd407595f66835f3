/**
 * @file network_capture.cpp
 * @brief DevTools Network.* event correlation
 */

#include "network_capture.h"
#include <algorithm>
#include <cctype>
#include <sstream>

using nlohmann::json;

const CapturedResponse* CaptureLog::response_for(const std::string& request_id) const {
    auto it = responses.find(request_id);
    return it == responses.end() ? nullptr : &it->second;
}

const CapturedRequest* CaptureLog::request_for(const std::string& request_id) const {
    for (const auto& r : requests) {
        if (r.id == request_id) return &r;
    }
    return nullptr;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string NetworkCapture::header_value(const std::map<std::string, std::string>& headers,
                                         const std::string& name) {
    std::string wanted = to_lower(name);
    for (const auto& [k, v] : headers) {
        if (to_lower(k) == wanted) return v;
    }
    return "";
}

std::optional<json> NetworkCapture::normalize_event(const RawEvent& event) {
    if (!event.is_object()) return std::nullopt;
    if (event.contains("method") && event["method"].is_string()) {
        return event;
    }
    auto it = event.find("message");
    if (it == event.end()) return std::nullopt;

    json inner;
    if (it->is_string()) {
        // WebDriver performance log: the message is a JSON document in a string
        inner = json::parse(it->get<std::string>(), nullptr, false);
        if (inner.is_discarded()) return std::nullopt;
    } else {
        inner = *it;
    }
    if (inner.is_object() && inner.contains("message") && inner["message"].is_object()) {
        inner = inner["message"];
    }
    if (inner.is_object() && inner.contains("method") && inner["method"].is_string()) {
        return inner;
    }
    return std::nullopt;
}

/// Member of obj if it is an object, else an empty object.
static json object_field(const json& obj, const char* key) {
    if (!obj.is_object()) return json::object();
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return json::object();
    return *it;
}

/// Member of obj if it is a string, else fallback.
static std::string string_field(const json& obj, const char* key, const std::string& fallback = "") {
    if (!obj.is_object()) return fallback;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

/// Flatten a DevTools headers object into name -> value.
static std::map<std::string, std::string> headers_from(const json& obj) {
    std::map<std::string, std::string> out;
    if (!obj.is_object()) return out;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it.value().is_string()) {
            out[it.key()] = it.value().get<std::string>();
        } else if (!it.value().is_null()) {
            out[it.key()] = it.value().dump();
        }
    }
    return out;
}

/// Set-Cookie values; DevTools joins repeated headers with '\n'.
static std::vector<std::string> split_set_cookie(const std::map<std::string, std::string>& headers) {
    std::vector<std::string> out;
    for (const auto& [k, v] : headers) {
        if (to_lower(k) != "set-cookie") continue;
        std::istringstream lines(v);
        std::string line;
        while (std::getline(lines, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) out.push_back(line);
        }
    }
    return out;
}

/// Merge headers and cookies from one response event into a record.
static void merge_response(CapturedResponse& resp, const json& r) {
    if (r.contains("status") && r["status"].is_number()) {
        resp.status = r["status"].get<long>();
    }
    if (r.contains("mimeType") && r["mimeType"].is_string()) {
        resp.mime_type = r["mimeType"].get<std::string>();
    }
    auto headers = headers_from(object_field(r, "headers"));
    for (const auto& c : split_set_cookie(headers)) {
        if (std::find(resp.set_cookies.begin(), resp.set_cookies.end(), c) == resp.set_cookies.end()) {
            resp.set_cookies.push_back(c);
        }
    }
    for (auto& [k, v] : headers) {
        resp.headers[k] = v;
    }
}

CaptureLog NetworkCapture::parse(const std::vector<RawEvent>& events) {
    CaptureLog log;
    std::map<std::string, size_t> index;                      // request id -> position
    std::map<std::string, int> hops;                          // request id -> redirects seen
    std::map<std::string, std::map<std::string, std::string>> early_headers;  // ExtraInfo before request
    size_t sequence = 0;

    for (const auto& raw : events) {
        auto ev = normalize_event(raw);
        if (!ev) {
            log.ignored_events++;
            continue;
        }
        const std::string method = (*ev)["method"].get<std::string>();
        const json params = object_field(*ev, "params");
        const std::string id = string_field(params, "requestId");
        if (id.empty()) {
            log.ignored_events++;
            continue;
        }

        if (method == "Network.requestWillBeSent") {
            const json req = object_field(params, "request");

            auto existing = index.find(id);
            if (existing != index.end() && params.contains("redirectResponse")) {
                // Close the previous hop under its own id
                std::string hop_id = id + ".r" + std::to_string(++hops[id]);
                size_t pos = existing->second;
                log.requests[pos].id = hop_id;
                index[hop_id] = pos;
                CapturedResponse hop_resp;
                auto prior = log.responses.find(id);
                if (prior != log.responses.end()) {
                    hop_resp = prior->second;
                    log.responses.erase(prior);
                }
                hop_resp.request_id = hop_id;
                merge_response(hop_resp, params["redirectResponse"]);
                log.responses[hop_id] = hop_resp;
            }

            CapturedRequest cr;
            cr.id = id;
            cr.url = string_field(req, "url");
            cr.method = string_field(req, "method", "GET");
            std::transform(cr.method.begin(), cr.method.end(), cr.method.begin(),
                           [](unsigned char c){ return std::toupper(c); });
            cr.headers = headers_from(object_field(req, "headers"));
            if (req.contains("postData") && req["postData"].is_string()) {
                cr.body = req["postData"].get<std::string>();
            }
            if (params.contains("timestamp") && params["timestamp"].is_number()) {
                cr.timestamp = params["timestamp"].get<double>();
            }
            cr.resource_type = string_field(params, "type");
            cr.sequence = sequence++;

            auto early = early_headers.find(id);
            if (early != early_headers.end()) {
                for (auto& [k, v] : early->second) cr.headers[k] = v;
                early_headers.erase(early);
            }

            index[id] = log.requests.size();
            log.requests.push_back(std::move(cr));
        } else if (method == "Network.requestWillBeSentExtraInfo") {
            auto extra = headers_from(object_field(params, "headers"));
            auto it = index.find(id);
            if (it == index.end()) {
                for (auto& [k, v] : extra) early_headers[id][k] = v;
            } else {
                for (auto& [k, v] : extra) log.requests[it->second].headers[k] = v;
            }
        } else if (method == "Network.responseReceived") {
            CapturedResponse& resp = log.responses[id];
            resp.request_id = id;
            merge_response(resp, object_field(params, "response"));
        } else if (method == "Network.responseReceivedExtraInfo") {
            CapturedResponse& resp = log.responses[id];
            resp.request_id = id;
            json shaped = json::object();
            shaped["headers"] = object_field(params, "headers");
            if (resp.status == 0 && params.contains("statusCode")) {
                shaped["status"] = params["statusCode"];
            }
            merge_response(resp, shaped);
        } else if (method == "Network.loadingFailed") {
            log.failed.insert(id);
        } else {
            log.ignored_events++;
        }
    }
    return log;
}

CaptureLog NetworkCapture::parse_json(const json& doc) {
    std::vector<RawEvent> events;
    const json* list = &doc;
    if (doc.is_object() && doc.contains("events")) {
        list = &doc["events"];
    }
    if (list->is_array()) {
        for (const auto& e : *list) events.push_back(e);
    }
    return parse(events);
}
