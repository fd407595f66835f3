#pragma once
#include "core/dedup_engine.h"
#include "core/http_client.h"
#include <map>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace config {

// Run settings for the discovery pipeline and the CLI.
// Files may be JSON (nested objects or dotted keys) or a small YAML subset:
// "section:" headers followed by indented "key: value" lines, or flat
// "section.key: value" lines. Unknown keys and bad values are reported and
// otherwise ignored.

struct Settings {
    HttpClient::Options http;

    long probe_timeout_seconds = 5;
    size_t probe_workers = 16;
    bool include_api_subdomain = false;

    DedupEngine::Options dedup;

    std::string webdriver_url = "http://127.0.0.1:9515";
    bool headless = true;
    long settle_ms = 3000;

    std::string login_email = "test@example.com";
    std::string login_password = "password123";

    std::string audit_log_path;     // empty = no audit log

    /**
     * @brief Settings with every default applied
     */
    static Settings get_default();

    /**
     * @brief Load settings from a JSON or YAML-subset file
     * @param path Settings file
     * @return Loaded settings; defaults (with a warning) if the file cannot be read
     */
    static Settings load(const std::string& path);

    /**
     * @brief Parse settings text, trying JSON first
     * @param content File contents
     * @param warnings Receives one line per ignored key or value, if non-null
     */
    static Settings parse(const std::string& content, std::vector<std::string>* warnings = nullptr);

    /**
     * @brief Apply dotted key/value pairs on top of existing settings
     * @return Keys that were unknown or had unusable values
     */
    std::vector<std::string> apply(const std::map<std::string, std::string>& values);

    /**
     * @brief Flatten "section: / key: value" text into dotted keys
     */
    static std::map<std::string, std::string> parse_yaml_subset(const std::string& content);

    /**
     * @brief Flatten a JSON object into dotted keys with string values
     */
    static std::map<std::string, std::string> flatten_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

} // namespace config
