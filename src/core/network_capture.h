#pragma once
#include "browser_driver.h"
#include <schema/login_capture.h>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Turns the raw DevTools event stream recorded during a scripted login into
// request/response records.
// Events are correlated by requestId. A redirect reuses the id of the
// request it replaces, so the earlier hop is kept under "<id>.r<n>" together
// with the redirect response that ended it.

/**
 * Parsed capture: requests in the order the browser issued them, responses
 * keyed by request id.
 */
struct CaptureLog {
    std::vector<CapturedRequest> requests;
    std::map<std::string, CapturedResponse> responses;
    std::set<std::string> failed;     // ids reported by Network.loadingFailed
    size_t ignored_events = 0;

    /**
     * @brief Response correlated with a request id
     * @return nullptr for fire-and-forget requests
     */
    const CapturedResponse* response_for(const std::string& request_id) const;

    /**
     * @brief Request by id, nullptr if unknown
     */
    const CapturedRequest* request_for(const std::string& request_id) const;
};

class NetworkCapture {
public:
    /// Bytes of a response body kept in CapturedResponse::body_sample.
    static constexpr size_t kBodySampleLimit = 64 * 1024;

    /**
     * @brief Parse a list of raw events
     * @param events DevTools messages, bare or wrapped in a WebDriver
     *        performance log entry
     * @return Correlated requests and responses
     */
    static CaptureLog parse(const std::vector<RawEvent>& events);

    /**
     * @brief Parse a saved capture file: a JSON array of events, or an
     * object holding such an array under "events"
     */
    static CaptureLog parse_json(const nlohmann::json& doc);

    /**
     * @brief Unwrap a WebDriver performance log entry into its
     * {"method", "params"} message
     * @return nullopt if the entry carries no DevTools message
     */
    static std::optional<nlohmann::json> normalize_event(const RawEvent& event);

    /**
     * @brief Case-insensitive header lookup on a captured header map
     * @return Header value, or empty string if absent
     */
    static std::string header_value(const std::map<std::string, std::string>& headers,
                                    const std::string& name);
};
