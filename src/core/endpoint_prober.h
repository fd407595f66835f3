#pragma once
#include "http_client.h"
#include "dedup_engine.h"
#include "cancellation.h"
#include <schema/endpoint.h>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Authenticated endpoint discovery.
// A catalog of likely API paths per resource type, plus API-shaped URLs seen
// during the login capture, is probed with the captured credentials by a
// bounded pool of worker threads. 2xx, 401 and 403 confirm that an endpoint
// exists; anything else, including timeouts, is dropped.

struct ProbeCandidate {
    std::string url;
    EndpointType type = EndpointType::UNKNOWN;
    std::string source;     // "catalog" or "observed"
};

struct ProbeResult {
    std::vector<Endpoint> endpoints;   // confirmed and new, in candidate order
    size_t attempted = 0;
    size_t transport_failures = 0;
    size_t discarded = 0;              // answered with a non-confirming status
    size_t duplicates = 0;             // confirmed but already known to the dedup engine
    bool cancelled = false;
};

using EndpointCatalog = std::vector<std::pair<EndpointType, std::vector<std::string>>>;

class EndpointProber {
public:
    struct Options {
        long timeout_seconds;
        size_t workers;
        bool include_api_subdomain;
        std::string user_agent;
        EndpointCatalog catalog;

        Options();
    };

    /**
     * @brief Create a prober
     * @param client HTTP client shared by all workers (perform is thread-safe)
     * @param opts Worker count, timeout and catalog
     */
    EndpointProber(const HttpClient& client, const Options& opts = Options());

    /**
     * @brief Candidate list for one site: catalog paths on every base, then observed URLs
     * @param site_url Target site (any URL on it)
     * @param observed_urls URLs seen during capture
     * @return Candidates without duplicate URLs, catalog entries first
     */
    std::vector<ProbeCandidate> build_candidates(const std::string& site_url,
                                                 const std::vector<std::string>& observed_urls) const;

    /**
     * @brief Probe candidates concurrently
     * @param candidates Output of build_candidates (or any list)
     * @param tokens Credentials from the login capture
     * @param dedup Engine every confirmed endpoint is checked against
     * @param cancel Stops new probes from being issued when raised
     * @param on_confirmed Called from worker threads for each new endpoint
     * @return Confirmed endpoints in candidate order plus counters
     */
    ProbeResult probe(const std::vector<ProbeCandidate>& candidates,
                      const std::map<std::string, std::string>& tokens,
                      DedupEngine& dedup,
                      const CancellationToken* cancel = nullptr,
                      const std::function<void(const Endpoint&)>& on_confirmed = nullptr) const;

    /**
     * @brief Single probe; no dedup involvement
     * @return Endpoint for 2xx/401/403, nullopt otherwise
     */
    std::optional<Endpoint> probe_one(const ProbeCandidate& candidate,
                                      const std::map<std::string, std::string>& headers,
                                      bool* transport_failed = nullptr) const;

    /**
     * @brief Request headers carrying the captured credentials
     */
    static std::map<std::string, std::string> auth_headers(const std::map<std::string, std::string>& tokens,
                                                           const std::string& user_agent);

    /**
     * @brief Origins to probe: the site origin, and api.<domain> when enabled
     */
    static std::vector<std::string> base_origins(const std::string& site_url, bool include_api_subdomain);

    /// /api/, /rest/, /graphql or a /v<N>/ version segment.
    static bool is_api_url(const std::string& url);

    static bool is_static_asset(const std::string& url);

    /// Whether url and site_url share a registrable domain (api.x.com and shop.x.com do).
    static bool same_site(const std::string& url, const std::string& site_url);

    /**
     * @brief Resource type of an observed URL, from keywords in its path
     */
    static EndpointType infer_type(const std::string& url);

    static const EndpointCatalog& default_catalog();

private:
    const HttpClient& client_;
    Options opts_;
};
