#pragma once
#include "network_capture.h"
#include "request_scorer.h"
#include <schema/login_capture.h>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Lifts credentials out of the selected login call.
// Sources are scanned in a fixed order: response headers, response JSON body,
// Set-Cookie values, then the request's own headers. A key is only set the
// first time it is found, so earlier sources win.

using TokenMap = std::map<std::string, std::string>;

class TokenExtractor {
public:
    /**
     * @brief Build the pipeline's LoginCapture for a selected candidate
     * @param selected Winning candidate from RequestScorer::select
     * @param log Capture the candidate came from (response lookup)
     * @return Capture with tokens and cookies filled in
     */
    static LoginCapture capture(const ScoredCandidate& selected, const CaptureLog& log);

    /**
     * @brief Bearer values and token-named headers
     * @param headers Header map to scan
     * @param tokens Output map; existing keys are never overwritten
     */
    static void from_headers(const std::map<std::string, std::string>& headers, TokenMap& tokens);

    /**
     * @brief Token fields and signed-token shaped strings anywhere in a JSON document
     */
    static void from_json(const nlohmann::json& doc, TokenMap& tokens);

    /**
     * @brief Parse one Set-Cookie header value
     * @param header e.g. "sid=abc; Path=/; HttpOnly"
     * @param default_domain Domain used when the cookie names none
     * @return Cookie, or nullopt if there is no name=value pair
     */
    static std::optional<Cookie> parse_set_cookie(const std::string& header,
                                                  const std::string& default_domain = "");

    /**
     * @brief Whether a string has the header.payload.signature JWT shape
     */
    static bool looks_like_jwt(const std::string& value);
};
