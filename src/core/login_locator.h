#pragma once
#include "http_client.h"
#include "cancellation.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Finds the login page of a site.
// Strategies run in a fixed order and the first one that resolves a URL
// wins: common login paths, login links on the homepage, then redirects
// from protected pages. When all of them fail the input URL is returned and
// the pipeline carries on against it.

enum class LocatorStrategy {
    COMMON_PATH,
    HOMEPAGE_LINK,
    ONCLICK,
    REDIRECT,
    FALLBACK
};

const char* locator_strategy_name(LocatorStrategy s);

struct LocatorResult {
    std::string url;
    LocatorStrategy strategy = LocatorStrategy::FALLBACK;
    bool found = false;
    std::string evidence;   // path, link text or redirect chain that matched
};

class LoginLocator {
public:
    struct Options {
        long probe_timeout_seconds;
        long page_timeout_seconds;
        std::vector<std::string> login_paths;
        std::vector<std::string> protected_paths;

        Options();
    };

    /**
     * @brief Create a locator
     * @param client HTTP client used for all probes
     * @param opts Path catalogs and timeouts
     * @param cancel Optional cancellation flag checked between probes
     */
    LoginLocator(const HttpClient& client, const Options& opts = Options(),
                 const CancellationToken* cancel = nullptr);

    /**
     * @brief Run every strategy in priority order
     * @param url Site URL supplied by the caller
     * @return First resolved login URL, or the input URL with strategy FALLBACK
     */
    LocatorResult locate(const std::string& url) const;

    /// Strategy 1: HEAD (GET if HEAD is refused) each catalog path.
    std::optional<LocatorResult> try_common_paths(const std::string& url) const;

    /// Strategy 2: anchors and onclick handlers on the homepage.
    std::optional<LocatorResult> try_homepage(const std::string& url) const;

    /// Strategy 3: protected paths that redirect to a login-looking URL.
    std::optional<LocatorResult> try_redirects(const std::string& url) const;

    /**
     * @brief Whether text (URL, link text, handler) mentions logging in
     */
    static bool mentions_login(const std::string& text);

    static const std::vector<std::string>& login_keywords();
    static const std::vector<std::string>& default_login_paths();
    static const std::vector<std::string>& default_protected_paths();

private:
    const HttpClient& client_;
    Options opts_;
    const CancellationToken* cancel_;

    bool cancelled() const { return cancel_ && cancel_->cancelled(); }
    static std::string strip_trailing_slash(const std::string& url);
};
