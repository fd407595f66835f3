/**
 * @file http_client.cpp
 * @brief Lightweight HTTP client using libcurl
 */

#include "http_client.h"
#include <curl/curl.h>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <string_view>

/// Callback invoked by libcurl to write the received body data.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

/// Callback invoked once per header line to parse header into map.
static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    std::string_view hv(buffer, total);
    auto* headers = static_cast<std::vector<std::pair<std::string, std::string>>*>(userdata);

    // A new status line starts a new header block (redirect hops)
    if (hv.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    auto pos = hv.find(':');
    if (pos != std::string_view::npos) {
        std::string name(hv.substr(0, pos));

        size_t val_start = pos + 1;
        while (val_start < hv.size() && (hv[val_start] == ' ' || hv[val_start] == '\t'))
            val_start++;

        size_t val_end = hv.size();
        while (val_end > val_start && (hv[val_end - 1] == '\r' || hv[val_end - 1] == '\n'))
            val_end--;
        std::string value(hv.substr(val_start, val_end - val_start));

        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return std::tolower(c); });

        headers->emplace_back(std::move(name), std::move(value));
    }
    return total;
}

std::string HttpResponse::header(const std::string& name) const {
    std::string lname = name;
    std::transform(lname.begin(), lname.end(), lname.begin(), [](unsigned char c){ return std::tolower(c); });
    for (const auto& h : headers) {
        std::string hn = h.first;
        std::transform(hn.begin(), hn.end(), hn.begin(), [](unsigned char c){ return std::tolower(c); });
        if (hn == lname) return h.second;
    }
    return "";
}

/// Initialize global libcurl state.
HttpClient::HttpClient(const Options& opts) : opts_(opts) {
    CURLcode c = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (c != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

/// Clean up global libcurl state.
HttpClient::~HttpClient() {
    curl_global_cleanup();
}

/// Execute an HTTP request and populate a response object.
bool HttpClient::perform(const HttpRequest& req, HttpResponse& resp) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return false;
    }

    std::string body;
    std::vector<std::pair<std::string, std::string>> resp_headers;

    long timeout = req.timeout_seconds > 0 ? req.timeout_seconds : opts_.timeout_seconds;
    long connect_timeout = std::min(opts_.connect_timeout_seconds, timeout);
    bool follow = req.follow_redirects.value_or(opts_.follow_redirects);

    // Basic configuration
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, follow ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opts_.max_redirects);

    // Response and header callbacks
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp_headers);

    // Misc options
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_VERBOSE, 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    if (opts_.accept_encoding) curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    // Request headers
    struct curl_slist* curl_headers = nullptr;
    for (const auto& h : req.headers) {
        std::string line = h.first + ": " + h.second;
        curl_headers = curl_slist_append(curl_headers, line.c_str());
    }
    if (curl_headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);

    // HTTP method and body
    if (req.method == "POST" || req.method == "PUT" || req.method == "PATCH") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    } else if (req.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (req.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }

    // Error buffer setup
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    // Perform request
    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        resp.error = errbuf[0] ? std::string(errbuf) : curl_easy_strerror(rc);
    }

    // Extract response info
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &resp.redirect_count);

    char* effective_url = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
    if (effective_url) resp.effective_url = effective_url;

    double total_time = 0.0;
    curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME, &total_time);

    // Populate response
    resp.total_time = total_time;
    resp.body = std::move(body);
    resp.body_bytes = resp.body.size();
    resp.headers = std::move(resp_headers);

    // Cleanup
    if (curl_headers) curl_slist_free_all(curl_headers);
    curl_easy_cleanup(curl);
    return rc == CURLE_OK;
}

std::string HttpClient::build_cookie_header(const std::map<std::string, std::string>& cookies) {
    std::ostringstream out;
    bool first = true;
    for (const auto& [name, value] : cookies) {
        if (!first) out << "; ";
        out << name << "=" << value;
        first = false;
    }
    return out.str();
}

/// Read one part of a parsed URL handle into a string.
static std::string url_part(CURLU* h, CURLUPart part) {
    char* value = nullptr;
    std::string out;
    if (curl_url_get(h, part, &value, 0) == CURLUE_OK && value) {
        out = value;
    }
    if (value) curl_free(value);
    return out;
}

std::string HttpClient::resolve_url(const std::string& base, const std::string& href) {
    if (href.empty()) return base;

    CURLU* h = curl_url();
    if (!h) return {};

    // Setting a relative reference on a handle that already holds a URL
    // resolves it against that URL
    if (curl_url_set(h, CURLUPART_URL, base.c_str(), 0) != CURLUE_OK ||
        curl_url_set(h, CURLUPART_URL, href.c_str(), CURLU_URLENCODE) != CURLUE_OK ||
        curl_url_set(h, CURLUPART_FRAGMENT, nullptr, 0) != CURLUE_OK) {
        curl_url_cleanup(h);
        return {};
    }

    std::string result = url_part(h, CURLUPART_URL);
    curl_url_cleanup(h);
    return result;
}

std::string HttpClient::origin_of(const std::string& url) {
    CURLU* h = curl_url();
    if (!h) return {};
    if (curl_url_set(h, CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        curl_url_cleanup(h);
        return {};
    }
    std::string scheme = url_part(h, CURLUPART_SCHEME);
    std::string host = url_part(h, CURLUPART_HOST);
    std::string port = url_part(h, CURLUPART_PORT);
    curl_url_cleanup(h);

    if (scheme.empty() || host.empty()) return {};
    std::string origin = scheme + "://" + host;
    if (!port.empty()) origin += ":" + port;
    return origin;
}

std::string HttpClient::path_of(const std::string& url) {
    CURLU* h = curl_url();
    if (!h) return "/";
    std::string path = "/";
    if (curl_url_set(h, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK) {
        std::string p = url_part(h, CURLUPART_PATH);
        if (!p.empty()) path = p;
    }
    curl_url_cleanup(h);
    return path;
}

std::string HttpClient::host_of(const std::string& url) {
    CURLU* h = curl_url();
    if (!h) return {};
    std::string host;
    if (curl_url_set(h, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK) {
        host = url_part(h, CURLUPART_HOST);
    }
    curl_url_cleanup(h);
    return host;
}
