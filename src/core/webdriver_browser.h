#pragma once
#include "browser_driver.h"
#include "http_client.h"
#include <string>
#include <vector>

// BrowserDriver over the W3C WebDriver HTTP protocol.
// Talks to a chromedriver-compatible server. Network capture uses the
// Chrome performance log and DevTools commands tunnelled through the
// "goog/cdp/execute" extension.

class WebDriverBrowser : public BrowserDriver {
public:
    struct Options {
        std::string webdriver_url;
        bool headless;
        long command_timeout_seconds;
        std::vector<std::string> chrome_args;

        Options()
            : webdriver_url("http://127.0.0.1:9515"),
              headless(true),
              command_timeout_seconds(30),
              chrome_args({"--no-sandbox", "--disable-dev-shm-usage", "--window-size=1366,900"})
        {}
    };

    /**
     * @brief Create an adapter; no session is started until open()
     * @param client HTTP client used for the wire protocol
     * @param opts Server URL and browser flags
     */
    WebDriverBrowser(const HttpClient& client, const Options& opts = Options());

    ~WebDriverBrowser() override;

    void open() override;
    void navigate(const std::string& url) override;
    bool fill_field(const std::string& selector, const std::string& value) override;
    bool click(const std::string& selector) override;
    bool enable_network_capture() override;
    std::vector<RawEvent> get_capture_log() override;
    nlohmann::json execute_script(const std::string& code) override;
    std::optional<std::string> fetch_response_body(const std::string& request_id) override;
    void close() override;

    const std::string& session_id() const { return session_id_; }

    /// Whether the last navigate() was acknowledged by the driver.
    bool last_navigation_ok() const { return last_navigation_ok_; }

    /// Whether the last close() ended the session on the server.
    bool closed_cleanly() const { return closed_cleanly_; }

    /**
     * @brief Capabilities sent with the new-session request
     */
    nlohmann::json capabilities() const;

private:
    const HttpClient& client_;
    Options opts_;
    std::string session_id_;
    bool last_navigation_ok_ = false;
    bool closed_cleanly_ = false;

    /**
     * @brief Send one WebDriver command
     * @param method HTTP verb
     * @param path Path below /session/{id} ("" for the session itself)
     * @param body JSON body, ignored for GET/DELETE
     * @param value Receives the "value" member of the reply
     * @return true if the server answered with a success status
     * @throws BrowserError if the server cannot be reached
     */
    bool command(const std::string& method, const std::string& path,
                 const nlohmann::json& body, nlohmann::json& value);

    bool cdp(const std::string& cmd, const nlohmann::json& params, nlohmann::json& result);

    /**
     * @brief Element reference for a CSS selector, empty if not found
     */
    std::string find_element(const std::string& selector);

    std::string base_url() const;
};
