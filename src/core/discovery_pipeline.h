#pragma once
#include "browser_driver.h"
#include "cancellation.h"
#include "dedup_engine.h"
#include "endpoint_prober.h"
#include "field_classifier.h"
#include "http_client.h"
#include "login_locator.h"
#include "network_capture.h"
#include "request_scorer.h"
#include <schema/endpoint.h>
#include <schema/login_capture.h>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logging { class ChainLogger; }

// End-to-end login capture and endpoint discovery for one site.
// Locate the login page, classify its form, submit fake credentials through
// the browser while recording network events, pick the login call, then
// probe for authenticated endpoints with whatever credentials came back.
// The browser is held exclusively from form classification until the
// capture has been read, and is released before probing starts.

enum class FormSource {
    NONE,
    STATIC,      // server-rendered HTML
    RENDERED,    // DOM after the browser ran the page
    DYNAMIC      // selector probing outside any <form>
};

const char* form_source_name(FormSource s);

struct DiscoveryResult {
    std::string target;
    LocatorResult login_page;
    std::optional<LoginForm> form;
    FormSource form_source = FormSource::NONE;
    bool capture_enabled = false;
    bool login_submitted = false;
    size_t captured_requests = 0;
    bool login_captured = false;
    std::optional<LoginCapture> capture;
    std::vector<Endpoint> endpoints;
    size_t endpoints_found = 0;
    size_t probes_attempted = 0;
    bool cancelled = false;

    nlohmann::json to_json() const;
};

class DiscoveryPipeline {
public:
    struct Options {
        LoginLocator::Options locator;
        EndpointProber::Options prober;
        std::string email;
        std::string password;
        long settle_ms;
        long page_timeout_seconds;

        Options()
            : email("test@example.com"),
              password("password123"),
              settle_ms(3000),
              page_timeout_seconds(15)
        {}
    };

    /**
     * @brief Create a pipeline
     * @param client HTTP client for the locator, static page fetch and probes
     * @param browser Browser adapter; opened and closed once per run
     * @param opts Stage options and fake credentials
     */
    DiscoveryPipeline(const HttpClient& client, BrowserDriver& browser, const Options& opts = Options());

    /**
     * @brief Run with a dedup state private to this run
     * @param target Site URL
     * @param cancel Optional cancellation flag
     * @param audit Optional audit log
     * @return Structured result; empty stages are reported, not thrown
     * @throws BrowserError if the browser cannot be started or driven
     */
    DiscoveryResult run(const std::string& target,
                        const CancellationToken* cancel = nullptr,
                        logging::ChainLogger* audit = nullptr);

    /**
     * @brief Run against a caller-owned dedup state (not cleared)
     *
     * Endpoints already known to the engine are left out of the result, so
     * repeated runs sharing one engine never report the same (method, url)
     * twice.
     */
    DiscoveryResult run(const std::string& target, DedupEngine& dedup,
                        const CancellationToken* cancel = nullptr,
                        logging::ChainLogger* audit = nullptr);

    /**
     * @brief Fetch a page over HTTP and classify its login form
     * @param url Login page URL
     * @param has_form Receives whether the markup had any <form>
     * @return Login form, or nullopt if none could be classified
     */
    std::optional<LoginForm> classify_static(const std::string& url, bool* has_form = nullptr) const;

    /**
     * @brief Classify the DOM as rendered by the browser
     */
    std::optional<LoginForm> classify_rendered(BrowserDriver& browser, const std::string& page_url) const;

    /**
     * @brief Locate login inputs by probing CSS selectors in the live page
     * @return Form flagged dynamic, or nullopt if no email and password input exist
     */
    std::optional<LoginForm> detect_dynamic(BrowserDriver& browser) const;

    /**
     * @brief Select the login call from a capture and lift its credentials
     * @param log Parsed capture; the selected response gets its body sample filled in
     * @param browser Used to fetch the response body, may be null
     */
    std::optional<LoginCapture> select_login_call(CaptureLog& log, BrowserDriver* browser) const;

    const DedupEngine& dedup() const { return dedup_; }

private:
    const HttpClient& client_;
    BrowserDriver& browser_;
    Options opts_;
    FieldClassifier classifier_;
    RequestScorer scorer_;
    DedupEngine dedup_;

    bool submit_form(BrowserDriver& browser, const LoginForm& form) const;
    void settle(const CancellationToken* cancel) const;
};

nlohmann::json endpoint_to_json(const Endpoint& ep);
nlohmann::json login_capture_to_json(const LoginCapture& capture);
nlohmann::json login_form_to_json(const LoginForm& form);

/**
 * @brief Serialize a report document
 *
 * Header values and bodies come from arbitrary servers and may hold bytes
 * that are not valid UTF-8; those are written as U+FFFD instead of failing.
 * @param doc Document to serialize
 * @param indent Pretty-print indent, -1 for a single line
 */
std::string dump_json(const nlohmann::json& doc, int indent = 2);
