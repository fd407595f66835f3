#pragma once
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Control surface over a real browser.
// The discovery core only talks to this interface: a WebDriver-backed
// implementation drives Chrome, tests use a scripted fake.

/**
 * Raised when the browser cannot be started, reached or driven at all.
 * This is the only failure the pipeline propagates to its caller.
 */
class BrowserError : public std::runtime_error {
public:
    explicit BrowserError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * One low-level network event, shaped like a DevTools protocol message:
 * {"method": "Network.requestWillBeSent", "params": {...}}
 */
using RawEvent = nlohmann::json;

class BrowserDriver {
public:
    virtual ~BrowserDriver() = default;

    /**
     * @brief Start or connect to the browser
     * @throws BrowserError if the browser is unavailable
     */
    virtual void open() = 0;

    virtual void navigate(const std::string& url) = 0;

    /**
     * @brief Type a value into the element matched by a CSS selector
     * @return false if no element matched
     */
    virtual bool fill_field(const std::string& selector, const std::string& value) = 0;

    /**
     * @brief Click the element matched by a CSS selector
     * @return false if no element matched
     */
    virtual bool click(const std::string& selector) = 0;

    /**
     * @brief Start recording protocol-level network events
     * @return false if the browser does not support capture
     */
    virtual bool enable_network_capture() = 0;

    /**
     * @brief Drain the network events recorded since capture was enabled
     */
    virtual std::vector<RawEvent> get_capture_log() = 0;

    /**
     * @brief Run a script in the page and return its JSON-converted result
     */
    virtual nlohmann::json execute_script(const std::string& code) = 0;

    /**
     * @brief Fetch a response body for a captured request, where supported
     */
    virtual std::optional<std::string> fetch_response_body(const std::string& request_id) {
        (void)request_id;
        return std::nullopt;
    }

    /**
     * @brief Release the browser. Must not throw and must be safe to call
     * more than once.
     */
    virtual void close() = 0;

    std::mutex& session_mutex() { return session_mutex_; }

private:
    std::mutex session_mutex_;
};

/**
 * Exclusive, scoped use of a browser. Opening happens on construction;
 * close() runs on destruction whether the scope ends normally, by
 * exception or by cancellation.
 */
class BrowserLease {
public:
    explicit BrowserLease(BrowserDriver& driver)
        : driver_(driver), lock_(driver.session_mutex())
    {
        try {
            driver_.open();
        } catch (...) {
            driver_.close();
            throw;
        }
    }

    ~BrowserLease() {
        release();
    }

    BrowserLease(const BrowserLease&) = delete;
    BrowserLease& operator=(const BrowserLease&) = delete;

    BrowserDriver* operator->() { return &driver_; }
    BrowserDriver& driver() { return driver_; }

    /**
     * @brief Close the browser early (before probing starts)
     */
    void release() {
        if (released_) return;
        released_ = true;
        driver_.close();
        lock_.unlock();
    }

private:
    BrowserDriver& driver_;
    std::unique_lock<std::mutex> lock_;
    bool released_ = false;
};
