#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @file login_capture.h
 * @brief Records produced while locating a login form and capturing the
 * network traffic of a scripted login.
 */

enum class FieldRole {
    EMAIL,
    USERNAME,
    PASSWORD,
    SUBMIT,
    CSRF,
    OTHER
};

inline const char* field_role_name(FieldRole role) {
    switch (role) {
        case FieldRole::EMAIL:    return "email";
        case FieldRole::USERNAME: return "username";
        case FieldRole::PASSWORD: return "password";
        case FieldRole::SUBMIT:   return "submit";
        case FieldRole::CSRF:     return "csrf";
        case FieldRole::OTHER:    return "other";
    }
    return "other";
}

/**
 * A classified form control. The selector is what the browser adapter
 * fills or clicks.
 */
struct CandidateField {
    FieldRole role = FieldRole::OTHER;
    std::string selector;
    std::map<std::string, std::string> attributes;
};

/**
 * One network request observed during the scripted login
 */
struct CapturedRequest {
    std::string id;
    std::string url;
    std::string method;
    std::map<std::string, std::string> headers;
    std::optional<std::string> body;
    double timestamp = 0.0;     // seconds, as reported by the browser
    size_t sequence = 0;        // position in the event stream
    std::string resource_type;
};

/**
 * Response matched to a CapturedRequest by id. Requests without a
 * response (beacons, aborted fetches) simply have no entry.
 */
struct CapturedResponse {
    std::string request_id;
    long status = 0;
    std::map<std::string, std::string> headers;
    std::vector<std::string> set_cookies;
    std::string mime_type;
    std::string body_sample;
};

struct Cookie {
    std::string name;
    std::string value;
    std::string domain;
    std::string path;
    bool secure = false;
    bool http_only = false;
};

/**
 * Outcome of one login attempt: the request believed to be the real
 * authentication call plus whatever credentials could be lifted from it.
 */
struct LoginCapture {
    CapturedRequest selected_request;
    std::optional<CapturedResponse> response;
    int score = 0;
    std::vector<std::string> reasons;
    std::map<std::string, std::string> tokens;
    std::vector<Cookie> cookies;
};
