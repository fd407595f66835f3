/**
 * @file token_extractor.cpp
 * @brief Token and cookie extraction from the login exchange
 */

#include "token_extractor.h"
#include "http_client.h"
#include <algorithm>
#include <cctype>
#include <regex>

using nlohmann::json;

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool TokenExtractor::looks_like_jwt(const std::string& value) {
    // Header and payload are base64url segments of at least four characters;
    // the signature is empty (unsigned token) or at least eight, which keeps
    // three-label hostnames like www.shop.test out
    static const std::regex jwt(R"([A-Za-z0-9_-]{4,}\.[A-Za-z0-9_-]{4,}\.(?:[A-Za-z0-9_+/=-]{8,})?)");
    return std::regex_match(value, jwt);
}

void TokenExtractor::from_headers(const std::map<std::string, std::string>& headers, TokenMap& tokens) {
    static const std::regex bearer(R"(Bearer\s+([A-Za-z0-9_.+/=-]+))", std::regex::icase);
    for (const auto& [name, value] : headers) {
        std::smatch m;
        if (std::regex_search(value, m, bearer)) {
            tokens.emplace("authorization_header", trim(value));
            tokens.emplace("access_token", m[1].str());
            continue;
        }
        std::string lname = to_lower(name);
        if (lname == "x-auth-token" || lname == "x-access-token" || lname == "x-token") {
            std::string v = trim(value);
            if (!v.empty()) tokens.emplace("access_token", v);
        } else if (lname == "x-csrf-token" || lname == "x-xsrf-token") {
            std::string v = trim(value);
            if (!v.empty()) tokens.emplace("csrf_token", v);
        }
    }
}

/// Normalized token key for a JSON field name, empty if the name is not token-like.
static std::string token_key_for(const std::string& field) {
    std::string f = to_lower(field);
    f.erase(std::remove(f.begin(), f.end(), '_'), f.end());
    if (f == "refreshtoken" || f == "refresh") return "refresh_token";
    if (f == "idtoken") return "id_token";
    if (f == "accesstoken" || f == "token" || f == "authtoken" || f == "jwt" || f == "bearer") {
        return "access_token";
    }
    return "";
}

static void walk_json(const json& node, const std::string& field, TokenMap& tokens) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            walk_json(it.value(), it.key(), tokens);
        }
    } else if (node.is_array()) {
        for (const auto& item : node) {
            walk_json(item, field, tokens);
        }
    } else if (node.is_string()) {
        const std::string value = node.get<std::string>();
        if (value.empty()) return;
        std::string key = token_key_for(field);
        if (!key.empty()) {
            tokens.emplace(key, value);
        } else if (TokenExtractor::looks_like_jwt(value)) {
            std::string lf = to_lower(field);
            if (lf.find("refresh") != std::string::npos) {
                tokens.emplace("refresh_token", value);
            } else if (lf.find("id_token") != std::string::npos || lf == "idtoken") {
                tokens.emplace("id_token", value);
            } else {
                tokens.emplace("access_token", value);
            }
        }
    }
}

void TokenExtractor::from_json(const json& doc, TokenMap& tokens) {
    walk_json(doc, "", tokens);
}

std::optional<Cookie> TokenExtractor::parse_set_cookie(const std::string& header, const std::string& default_domain) {
    size_t semi = header.find(';');
    std::string pair = trim(header.substr(0, semi));
    size_t eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) return std::nullopt;

    Cookie c;
    c.name = trim(pair.substr(0, eq));
    c.value = trim(pair.substr(eq + 1));
    c.domain = default_domain;
    c.path = "/";

    while (semi != std::string::npos) {
        size_t next = header.find(';', semi + 1);
        std::string attr = trim(header.substr(semi + 1, next == std::string::npos ? std::string::npos : next - semi - 1));
        semi = next;
        if (attr.empty()) continue;

        size_t aeq = attr.find('=');
        std::string key = to_lower(trim(attr.substr(0, aeq)));
        std::string val = aeq == std::string::npos ? "" : trim(attr.substr(aeq + 1));
        if (key == "domain" && !val.empty()) {
            c.domain = val[0] == '.' ? val.substr(1) : val;
        } else if (key == "path" && !val.empty()) {
            c.path = val;
        } else if (key == "secure") {
            c.secure = true;
        } else if (key == "httponly") {
            c.http_only = true;
        }
    }
    return c;
}

LoginCapture TokenExtractor::capture(const ScoredCandidate& selected, const CaptureLog& log) {
    LoginCapture out;
    out.selected_request = selected.request;
    out.score = selected.score;
    out.reasons = selected.reasons;

    const CapturedResponse* resp = log.response_for(selected.request.id);
    if (resp) {
        out.response = *resp;
        from_headers(resp->headers, out.tokens);

        if (!resp->body_sample.empty()) {
            json body = json::parse(resp->body_sample, nullptr, false);
            if (!body.is_discarded()) {
                from_json(body, out.tokens);
            }
        }

        const std::string host = HttpClient::host_of(selected.request.url);
        std::string cookie_header;
        for (const auto& raw : resp->set_cookies) {
            auto cookie = parse_set_cookie(raw, host);
            if (!cookie) continue;
            if (!cookie_header.empty()) cookie_header += "; ";
            cookie_header += cookie->name + "=" + cookie->value;
            if (looks_like_jwt(cookie->value)) {
                out.tokens.emplace("access_token", cookie->value);
            }
            out.cookies.push_back(*cookie);
        }
        if (!cookie_header.empty()) {
            out.tokens.emplace("cookies", cookie_header);
        }
    }

    from_headers(selected.request.headers, out.tokens);
    return out;
}
