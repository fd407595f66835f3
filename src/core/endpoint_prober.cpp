/**
 * @file endpoint_prober.cpp
 * @brief Concurrent authenticated endpoint probing
 */

#include "endpoint_prober.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <regex>
#include <thread>

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

const EndpointCatalog& EndpointProber::default_catalog() {
    static const EndpointCatalog catalog = {
        {EndpointType::PROFILE, {
            "/api/user", "/api/profile", "/api/me", "/api/user/profile", "/api/user/me",
            "/api/account", "/api/account/profile", "/api/v1/user", "/api/v1/profile",
            "/profile", "/user/profile"
        }},
        {EndpointType::PAYMENT, {
            "/api/payment/methods", "/api/payment", "/api/billing", "/api/user/payment",
            "/api/cards", "/api/payment/cards", "/api/v1/payment/methods", "/api/v1/billing"
        }},
        {EndpointType::ORDERS, {
            "/api/orders", "/api/user/orders", "/api/order/history", "/api/purchases",
            "/api/transactions", "/api/v1/orders", "/api/v1/user/orders", "/api/v2/orders",
            "/api/v3/orders", "/v1/user/orders", "/v2/user/orders", "/v3/user/orders"
        }},
        {EndpointType::ADDRESSES, {
            "/api/addresses", "/api/user/addresses", "/api/user/address",
            "/api/delivery/addresses", "/api/shipping/addresses", "/api/v1/addresses",
            "/api/v1/user/addresses", "/api/v2/addresses", "/api/v3/addresses",
            "/v1/user/addresses", "/v2/user/addresses", "/v3/user/addresses"
        }},
        {EndpointType::WALLET, {
            "/api/wallet", "/api/wallet/balance", "/api/user/wallet", "/api/balance",
            "/api/credits", "/api/points", "/api/v1/wallet", "/api/v1/balance"
        }}
    };
    return catalog;
}

EndpointProber::Options::Options()
    : timeout_seconds(5),
      workers(16),
      include_api_subdomain(false),
      user_agent("Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36"),
      catalog(default_catalog())
{}

EndpointProber::EndpointProber(const HttpClient& client, const Options& opts)
    : client_(client), opts_(opts) {}

bool EndpointProber::is_api_url(const std::string& url) {
    static const std::regex version_segment(R"(/v[0-9]+(/|$))");
    std::string path = to_lower(HttpClient::path_of(url));
    if (contains_any(path, {"/api/", "/rest/", "/graphql"})) return true;
    if (path == "/api" || path.compare(0, 5, "/api?") == 0) return true;
    return std::regex_search(path, version_segment);
}

bool EndpointProber::is_static_asset(const std::string& url) {
    static const std::vector<std::string> exts = {
        ".js", ".mjs", ".css", ".map", ".png", ".jpg", ".jpeg", ".gif", ".svg", ".webp",
        ".ico", ".woff", ".woff2", ".ttf", ".eot", ".mp4", ".webm", ".mp3", ".pdf"
    };
    std::string path = to_lower(HttpClient::path_of(url));
    for (const auto& ext : exts) {
        if (path.size() >= ext.size() && path.compare(path.size() - ext.size(), ext.size(), ext) == 0) {
            return true;
        }
    }
    return false;
}

/// Host with a leading "www." removed.
static std::string registrable_host(const std::string& url) {
    std::string host = to_lower(HttpClient::host_of(url));
    if (host.compare(0, 4, "www.") == 0) host = host.substr(4);
    return host;
}

/// Host labels, lowercase.
static std::vector<std::string> host_labels(const std::string& host) {
    std::vector<std::string> labels;
    size_t start = 0;
    while (start <= host.size()) {
        size_t dot = host.find('.', start);
        if (dot == std::string::npos) dot = host.size();
        labels.push_back(host.substr(start, dot - start));
        start = dot + 1;
    }
    return labels;
}

/// The last two labels of a host, or three under a two-letter country code
/// with a generic second level such as co.uk or com.au.
static std::string site_domain(const std::string& host) {
    static const std::vector<std::string> second_levels = {"co", "com", "net", "org", "gov", "ac", "edu", "ne", "or"};
    auto labels = host_labels(host);
    size_t keep = 2;
    if (labels.size() >= 3 && labels.back().size() == 2 &&
        std::find(second_levels.begin(), second_levels.end(), labels[labels.size() - 2]) != second_levels.end()) {
        keep = 3;
    }
    if (labels.size() <= keep) return host;
    std::string out;
    for (size_t i = labels.size() - keep; i < labels.size(); i++) {
        if (!out.empty()) out += ".";
        out += labels[i];
    }
    return out;
}

/// IPv6 literals carry a colon; IPv4 ones are digits and dots only.
static bool is_ip_host(const std::string& host) {
    if (host.find(':') != std::string::npos) return true;
    return std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.';
    });
}

bool EndpointProber::same_site(const std::string& url, const std::string& site_url) {
    std::string host = to_lower(HttpClient::host_of(url));
    std::string site = to_lower(HttpClient::host_of(site_url));
    if (host.empty() || site.empty()) return false;
    if (host == site) return true;
    if (is_ip_host(host) || is_ip_host(site)) return false;
    return site_domain(host) == site_domain(site);
}

EndpointType EndpointProber::infer_type(const std::string& url) {
    // Specific resources first; "user" and "account" also appear in their paths
    std::string path = to_lower(HttpClient::path_of(url));
    if (contains_any(path, {"payment", "card", "billing"}))         return EndpointType::PAYMENT;
    if (contains_any(path, {"order", "purchase", "transaction"}))   return EndpointType::ORDERS;
    if (contains_any(path, {"address", "location", "delivery"}))    return EndpointType::ADDRESSES;
    if (contains_any(path, {"wallet", "balance", "credit"}))        return EndpointType::WALLET;
    if (contains_any(path, {"profile", "user", "account", "/me"}))  return EndpointType::PROFILE;
    if (contains_any(path, {"auth", "login", "signin", "token", "session"})) return EndpointType::AUTH;
    return EndpointType::UNKNOWN;
}

std::vector<std::string> EndpointProber::base_origins(const std::string& site_url, bool include_api_subdomain) {
    std::vector<std::string> out;
    std::string origin = HttpClient::origin_of(site_url);
    if (origin.empty()) return out;
    out.push_back(origin);

    if (include_api_subdomain) {
        std::string host = to_lower(HttpClient::host_of(site_url));
        std::string bare = registrable_host(site_url);
        bool is_ip = !host.empty() && std::all_of(host.begin(), host.end(), [](unsigned char c) {
            return std::isdigit(c) || c == '.' || c == ':';
        });
        bool single_label = bare.find('.') == std::string::npos;
        if (!is_ip && !single_label && bare.compare(0, 4, "api.") != 0) {
            size_t pos = to_lower(origin).find(host);
            if (pos != std::string::npos) {
                std::string api = origin;
                api.replace(pos, host.size(), "api." + bare);
                out.push_back(api);
            }
        }
    }
    return out;
}

std::vector<ProbeCandidate> EndpointProber::build_candidates(const std::string& site_url,
                                                             const std::vector<std::string>& observed_urls) const {
    std::vector<ProbeCandidate> all;
    for (const auto& origin : base_origins(site_url, opts_.include_api_subdomain)) {
        for (const auto& [type, paths] : opts_.catalog) {
            for (const auto& path : paths) {
                all.push_back({origin + path, type, "catalog"});
            }
        }
    }

    for (const auto& raw : observed_urls) {
        std::string url = HttpClient::resolve_url(raw, raw);
        if (url.empty()) continue;
        if (!same_site(url, site_url) || is_static_asset(url) || !is_api_url(url)) continue;
        all.push_back({url, infer_type(url), "observed"});
    }

    return dedupe(all, [](const ProbeCandidate& c) { return c.url; });
}

std::map<std::string, std::string> EndpointProber::auth_headers(const std::map<std::string, std::string>& tokens,
                                                                const std::string& user_agent) {
    std::map<std::string, std::string> headers = {
        {"User-Agent", user_agent},
        {"Accept", "application/json"},
        {"Accept-Language", "en-US,en;q=0.9"}
    };
    auto token = tokens.find("access_token");
    auto raw_auth = tokens.find("authorization_header");
    if (token != tokens.end() && !token->second.empty()) {
        headers["Authorization"] = "Bearer " + token->second;
    } else if (raw_auth != tokens.end() && !raw_auth->second.empty()) {
        headers["Authorization"] = raw_auth->second;
    }
    auto cookies = tokens.find("cookies");
    if (cookies != tokens.end() && !cookies->second.empty()) {
        headers["Cookie"] = cookies->second;
    }
    return headers;
}

std::optional<Endpoint> EndpointProber::probe_one(const ProbeCandidate& candidate,
                                                  const std::map<std::string, std::string>& headers,
                                                  bool* transport_failed) const {
    HttpRequest req;
    req.method = "GET";
    req.url = candidate.url;
    req.headers = headers;
    req.timeout_seconds = opts_.timeout_seconds;
    req.follow_redirects = false;

    HttpResponse resp;
    if (!client_.perform(req, resp)) {
        if (transport_failed) *transport_failed = true;
        return std::nullopt;
    }
    if (transport_failed) *transport_failed = false;

    bool ok = resp.status >= 200 && resp.status < 300;
    bool denied = resp.status == 401 || resp.status == 403;
    if (!ok && !denied) return std::nullopt;

    Endpoint ep;
    ep.url = candidate.url;
    ep.method = "GET";
    ep.type = candidate.type;
    ep.tested = true;
    ep.accessible = ok;
    ep.status_code = resp.status;
    ep.headers = resp.headers;
    ep.content_type = resp.header("content-type");
    ep.body_bytes = resp.body_bytes ? resp.body_bytes : resp.body.size();
    ep.source = candidate.source;
    return ep;
}

ProbeResult EndpointProber::probe(const std::vector<ProbeCandidate>& candidates,
                                  const std::map<std::string, std::string>& tokens,
                                  DedupEngine& dedup,
                                  const CancellationToken* cancel,
                                  const std::function<void(const Endpoint&)>& on_confirmed) const {
    ProbeResult result;
    if (candidates.empty()) return result;

    const auto headers = auth_headers(tokens, opts_.user_agent);
    std::vector<std::optional<Endpoint>> slots(candidates.size());
    std::atomic<size_t> next{0};
    std::atomic<size_t> attempted{0}, failures{0}, discarded{0}, duplicates{0};

    // Workers pull the next index, so a hung probe only holds its own thread
    auto worker = [&]() {
        for (;;) {
            if (cancel && cancel->cancelled()) return;
            size_t idx = next.fetch_add(1);
            if (idx >= candidates.size()) return;

            attempted++;
            bool transport_failed = false;
            auto ep = probe_one(candidates[idx], headers, &transport_failed);
            if (!ep) {
                if (transport_failed) failures++;
                else discarded++;
                continue;
            }
            if (!dedup.insert_if_new(ep->dedup_key())) {
                duplicates++;
                continue;
            }
            if (on_confirmed) on_confirmed(*ep);
            slots[idx] = std::move(ep);
        }
    };

    size_t worker_count = std::max<size_t>(1, std::min(opts_.workers, candidates.size()));
    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (size_t i = 0; i < worker_count; i++) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    for (auto& slot : slots) {
        if (slot) result.endpoints.push_back(std::move(*slot));
    }
    result.attempted = attempted.load();
    result.transport_failures = failures.load();
    result.discarded = discarded.load();
    result.duplicates = duplicates.load();
    result.cancelled = cancel && cancel->cancelled() && result.attempted < candidates.size();
    return result;
}
