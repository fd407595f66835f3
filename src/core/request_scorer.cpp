/**
 * @file request_scorer.cpp
 * @brief Weighted rule scoring of captured login candidates
 */

#include "request_scorer.h"
#include "http_client.h"
#include <algorithm>
#include <cctype>
#include <sstream>

/// Convert string copy to lowercase using lambda on each character.
static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

static bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

static bool has_body(const CapturedRequest& r) {
    return r.body.has_value() && !r.body->empty();
}

static std::string lower_body(const CapturedRequest& r) {
    return r.body ? to_lower(*r.body) : std::string();
}

/// True if one path segment equals seg exactly.
static bool has_path_segment(const std::string& url, const std::string& seg) {
    std::istringstream parts(to_lower(HttpClient::path_of(url)));
    std::string part;
    while (std::getline(parts, part, '/')) {
        if (part == seg) return true;
    }
    return false;
}

const std::vector<std::string>& RequestScorer::auth_keywords() {
    static const std::vector<std::string> kw = {
        "login", "signin", "sign-in", "sign_in", "logon", "auth", "token", "session", "sso"
    };
    return kw;
}

std::vector<ScoringRule> RequestScorer::default_rules() {
    // Baseline weights; changing them is a policy change
    return {
        {"auth-segment", 10, [](const CapturedRequest& r) {
            return has_path_segment(r.url, "auth");
        }},
        {"login-keyword", 8, [](const CapturedRequest& r) {
            return to_lower(r.url).find("login") != std::string::npos;
        }},
        {"signin-keyword", 8, [](const CapturedRequest& r) {
            return to_lower(r.url).find("signin") != std::string::npos;
        }},
        {"token-keyword", 5, [](const CapturedRequest& r) {
            return to_lower(r.url).find("token") != std::string::npos;
        }},
        {"session-keyword", 5, [](const CapturedRequest& r) {
            return to_lower(r.url).find("session") != std::string::npos;
        }},
        {"json-content-type", 3, [](const CapturedRequest& r) {
            return to_lower(NetworkCapture::header_value(r.headers, "content-type")).find("json") != std::string::npos;
        }},
        {"has-body", 5, [](const CapturedRequest& r) {
            return has_body(r);
        }},
        {"credential-field", 10, [](const CapturedRequest& r) {
            return contains_any(lower_body(r), {"email", "password", "passwd", "pwd"});
        }},
        {"username-field", 8, [](const CapturedRequest& r) {
            return contains_any(lower_body(r), {"username", "user_name", "userid", "user_id", "login"});
        }}
    };
}

RequestScorer::RequestScorer() : rules_(default_rules()) {}

RequestScorer::RequestScorer(std::vector<ScoringRule> rules) : rules_(std::move(rules)) {}

bool RequestScorer::is_candidate(const CapturedRequest& req) const {
    if (req.method != "POST" && req.method != "PUT") return false;
    return contains_any(to_lower(req.url), auth_keywords()) || has_body(req);
}

ScoredCandidate RequestScorer::score(const CapturedRequest& req) const {
    ScoredCandidate sc;
    sc.request = req;
    for (const auto& rule : rules_) {
        if (rule.matches(req)) {
            sc.score += rule.weight;
            sc.reasons.push_back(rule.name + " +" + std::to_string(rule.weight));
        }
    }
    return sc;
}

std::vector<ScoredCandidate> RequestScorer::rank(const CaptureLog& log) const {
    std::vector<ScoredCandidate> ranked;
    for (const auto& req : log.requests) {
        if (is_candidate(req)) {
            ranked.push_back(score(req));
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.request.timestamp != b.request.timestamp) return a.request.timestamp < b.request.timestamp;
        return a.request.sequence < b.request.sequence;
    });
    return ranked;
}

std::optional<ScoredCandidate> RequestScorer::select(const CaptureLog& log) const {
    auto ranked = rank(log);
    if (ranked.empty() || ranked.front().score <= 0) {
        return std::nullopt;
    }
    return ranked.front();
}
