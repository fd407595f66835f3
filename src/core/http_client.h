#pragma once
#include <string>
#include <map>
#include <vector>
#include <optional>

// HTTP client wrapper around libcurl.
// Every stage that touches the network (locator, prober, WebDriver adapter)
// goes through this class, so tests can replace perform() with a fake.

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    long timeout_seconds = 0;                 // 0 = client default
    std::optional<bool> follow_redirects;     // unset = client default
};

struct HttpResponse {
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string effective_url;
    std::string error;
    double total_time = 0.0;
    size_t body_bytes = 0;
    long redirect_count = 0;

    /**
     * @brief Case-insensitive lookup of the first header with this name
     * @param name Header name
     * @return Header value, or empty string if absent
     */
    std::string header(const std::string& name) const;
};

class HttpClient {
public:
    struct Options {
        long timeout_seconds;
        long connect_timeout_seconds;
        bool follow_redirects;
        long max_redirects;
        std::string user_agent;
        bool accept_encoding;

        Options()
            : timeout_seconds(15),
              connect_timeout_seconds(5),
              follow_redirects(true),
              max_redirects(5),
              user_agent("authtrace/0.1"),
              accept_encoding(true)
        {}
    };

    /**
     * @brief Create an HTTP client with the given options
     * @param opts Client configuration (timeouts, redirects, etc.)
     */
    explicit HttpClient(const Options& opts = Options());

    virtual ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Make an HTTP request and fill in the response
     * @param req Request details (method, URL, headers, body)
     * @param resp Response object that gets populated
     * @return true if a response was received, false on transport error
     *
     * Safe to call concurrently: each call owns its own curl handle.
     */
    virtual bool perform(const HttpRequest& req, HttpResponse& resp) const;

    const Options& options() const { return opts_; }

    /**
     * @brief Build a Cookie header string from a map of cookies
     * @param cookies Map of cookie name -> value
     * @return Cookie header value string (e.g., "name1=value1; name2=value2")
     */
    static std::string build_cookie_header(const std::map<std::string, std::string>& cookies);

    /**
     * @brief Resolve a possibly relative reference against a base URL
     * @param base Absolute base URL
     * @param href Reference found in markup or a redirect
     * @return Absolute URL without fragment, or empty string if unresolvable
     */
    static std::string resolve_url(const std::string& base, const std::string& href);

    /**
     * @brief Extract scheme://host[:port] from a URL
     * @param url Full URL
     * @return Origin string, or empty if URL is invalid
     */
    static std::string origin_of(const std::string& url);

    /**
     * @brief Extract the path component of a URL ("/" if none)
     */
    static std::string path_of(const std::string& url);

    /**
     * @brief Extract the host component of a URL
     */
    static std::string host_of(const std::string& url);

private:
    Options opts_;
};
