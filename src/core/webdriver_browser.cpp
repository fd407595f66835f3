/**
 * @file webdriver_browser.cpp
 * @brief W3C WebDriver client for the browser adapter
 */

#include "webdriver_browser.h"
#include "network_capture.h"
#include <openssl/evp.h>
#include <algorithm>

using nlohmann::json;

static const char* kElementKey = "element-6066-11e4-a52e-4f735466cecf";

WebDriverBrowser::WebDriverBrowser(const HttpClient& client, const Options& opts)
    : client_(client), opts_(opts) {}

WebDriverBrowser::~WebDriverBrowser() {
    close();
}

std::string WebDriverBrowser::base_url() const {
    std::string base = opts_.webdriver_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base;
}

json WebDriverBrowser::capabilities() const {
    json args = json::array();
    if (opts_.headless) {
        args.push_back("--headless=new");
    }
    for (const auto& a : opts_.chrome_args) {
        args.push_back(a);
    }
    json always;
    always["browserName"] = "chrome";
    always["goog:chromeOptions"] = {{"args", args}};
    always["goog:loggingPrefs"] = {{"performance", "ALL"}};
    return {{"capabilities", {{"alwaysMatch", always}}}};
}

bool WebDriverBrowser::command(const std::string& method, const std::string& path,
                               const json& body, json& value) {
    HttpRequest req;
    req.method = method;
    req.url = base_url() + "/session" + (session_id_.empty() ? "" : "/" + session_id_) + path;
    req.timeout_seconds = opts_.command_timeout_seconds;
    req.follow_redirects = false;
    req.headers["Content-Type"] = "application/json; charset=utf-8";
    req.headers["Accept"] = "application/json";
    if (method != "GET" && method != "DELETE") {
        req.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    HttpResponse resp;
    if (!client_.perform(req, resp)) {
        throw BrowserError("webdriver unreachable at " + base_url() + ": " + resp.error);
    }

    json reply = json::parse(resp.body, nullptr, false);
    value = (!reply.is_discarded() && reply.is_object() && reply.contains("value"))
        ? reply["value"] : json();
    return resp.status >= 200 && resp.status < 300;
}

void WebDriverBrowser::open() {
    if (!session_id_.empty()) return;

    HttpRequest req;
    req.method = "POST";
    req.url = base_url() + "/session";
    req.timeout_seconds = opts_.command_timeout_seconds;
    req.headers["Content-Type"] = "application/json; charset=utf-8";
    req.body = capabilities().dump();

    HttpResponse resp;
    if (!client_.perform(req, resp)) {
        throw BrowserError("cannot reach webdriver at " + base_url() + ": " + resp.error);
    }

    json reply = json::parse(resp.body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw BrowserError("webdriver returned a non-JSON reply (HTTP " + std::to_string(resp.status) + ")");
    }
    json value = reply.value("value", json::object());
    std::string id = value.is_object() ? value.value("sessionId", "") : "";
    if (id.empty()) {
        id = reply.value("sessionId", "");
    }
    if (resp.status != 200 || id.empty()) {
        std::string message = value.is_object() ? value.value("message", "") : "";
        throw BrowserError("session not created (HTTP " + std::to_string(resp.status) + ")" +
                           (message.empty() ? "" : ": " + message));
    }
    session_id_ = id;
}

void WebDriverBrowser::navigate(const std::string& url) {
    if (session_id_.empty()) throw BrowserError("navigate without a session");
    json value;
    // Page errors still leave a usable session; only transport failure is fatal
    last_navigation_ok_ = command("POST", "/url", {{"url", url}}, value);
}

std::string WebDriverBrowser::find_element(const std::string& selector) {
    json value;
    if (!command("POST", "/element", {{"using", "css selector"}, {"value", selector}}, value)) {
        return "";
    }
    if (!value.is_object()) return "";
    if (value.contains(kElementKey)) return value[kElementKey].get<std::string>();
    if (value.contains("ELEMENT")) return value["ELEMENT"].get<std::string>();
    return "";
}

bool WebDriverBrowser::fill_field(const std::string& selector, const std::string& value) {
    if (session_id_.empty()) return false;
    std::string element = find_element(selector);
    if (element.empty()) return false;

    json ignored;
    return command("POST", "/element/" + element + "/value", {{"text", value}}, ignored);
}

bool WebDriverBrowser::click(const std::string& selector) {
    if (session_id_.empty()) return false;
    std::string element = find_element(selector);
    if (element.empty()) return false;

    json ignored;
    if (command("POST", "/element/" + element + "/click", json::object(), ignored)) {
        return true;
    }
    // Covered or off-screen controls still take a scripted click
    json ref = json::object();
    ref[kElementKey] = element;
    json args = json::array({ref});
    return command("POST", "/execute/sync",
                   {{"script", "arguments[0].click(); return true;"}, {"args", args}}, ignored);
}

bool WebDriverBrowser::cdp(const std::string& cmd, const json& params, json& result) {
    return command("POST", "/goog/cdp/execute", {{"cmd", cmd}, {"params", params}}, result);
}

bool WebDriverBrowser::enable_network_capture() {
    if (session_id_.empty()) return false;
    json result;
    return cdp("Network.enable", json::object(), result);
}

std::vector<RawEvent> WebDriverBrowser::get_capture_log() {
    std::vector<RawEvent> events;
    if (session_id_.empty()) return events;

    json entries;
    if (!command("POST", "/se/log", {{"type", "performance"}}, entries) || !entries.is_array()) {
        return events;
    }
    for (const auto& entry : entries) {
        auto msg = NetworkCapture::normalize_event(entry);
        if (!msg) continue;
        const std::string method = (*msg)["method"].get<std::string>();
        if (method.compare(0, 8, "Network.") == 0) {
            events.push_back(*msg);
        }
    }
    return events;
}

json WebDriverBrowser::execute_script(const std::string& code) {
    if (session_id_.empty()) throw BrowserError("execute_script without a session");
    json value;
    if (!command("POST", "/execute/sync", {{"script", code}, {"args", json::array()}}, value)) {
        return json();
    }
    return value;
}

/// Decode base64 with OpenSSL, trimming the padding bytes EVP_DecodeBlock leaves in.
static std::optional<std::string> decode_base64(const std::string& in) {
    if (in.empty()) return std::string();
    std::string out(3 * ((in.size() + 3) / 4), '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    if (n < 0) return std::nullopt;
    size_t len = static_cast<size_t>(n);
    size_t pad = 0;
    for (size_t i = in.size(); i > 0 && in[i - 1] == '=' && pad < 2; i--) pad++;
    out.resize(len - std::min(pad, len));
    return out;
}

std::optional<std::string> WebDriverBrowser::fetch_response_body(const std::string& request_id) {
    if (session_id_.empty()) return std::nullopt;
    json result;
    if (!cdp("Network.getResponseBody", {{"requestId", request_id}}, result) || !result.is_object()) {
        return std::nullopt;
    }
    std::string body = result.value("body", "");
    if (result.value("base64Encoded", false)) {
        return decode_base64(body);
    }
    return body;
}

void WebDriverBrowser::close() {
    if (session_id_.empty()) return;

    HttpRequest req;
    req.method = "DELETE";
    req.url = base_url() + "/session/" + session_id_;
    req.timeout_seconds = opts_.command_timeout_seconds;
    HttpResponse resp;
    // The session is forgotten either way
    closed_cleanly_ = client_.perform(req, resp) && resp.status < 400;
    session_id_.clear();
}
