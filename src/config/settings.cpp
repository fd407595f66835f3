// Settings loading: JSON first, YAML subset as fallback

#include "settings.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>

namespace config {

using json = nlohmann::json;

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

/// Remove one level of matching quotes.
static std::string unquote(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

/// Drop a trailing "# comment" that is not inside quotes.
static std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
            return line.substr(0, i);
        }
    }
    return line;
}

static bool parse_bool(const std::string& v, bool& out) {
    std::string l = v;
    std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c){ return std::tolower(c); });
    if (l == "true" || l == "yes" || l == "on" || l == "1") { out = true; return true; }
    if (l == "false" || l == "no" || l == "off" || l == "0") { out = false; return true; }
    return false;
}

static bool parse_long(const std::string& v, long& out) {
    try {
        size_t used = 0;
        long n = std::stol(v, &used);
        if (used != v.size()) return false;
        out = n;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_double(const std::string& v, double& out) {
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size()) return false;
        out = d;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

Settings Settings::get_default() {
    return Settings();
}

std::map<std::string, std::string> Settings::parse_yaml_subset(const std::string& content) {
    std::map<std::string, std::string> out;
    std::istringstream in(content);
    std::string line;
    std::string section;

    while (std::getline(in, line)) {
        std::string text = strip_comment(line);
        if (trim(text).empty() || trim(text) == "---") continue;

        size_t indent = text.find_first_not_of(" \t");
        std::string body = trim(text);
        size_t colon = body.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(body.substr(0, colon));
        std::string value = unquote(trim(body.substr(colon + 1)));

        if (indent == 0) {
            if (value.empty()) {
                section = key;
                continue;
            }
            section.clear();
            out[key] = value;
        } else if (!section.empty()) {
            out[section + "." + key] = value;
        } else {
            out[key] = value;
        }
    }
    return out;
}

std::map<std::string, std::string> Settings::flatten_json(const json& j) {
    std::map<std::string, std::string> out;
    std::function<void(const json&, const std::string&)> walk = [&](const json& node, const std::string& prefix) {
        if (node.is_object()) {
            for (auto it = node.begin(); it != node.end(); ++it) {
                walk(it.value(), prefix.empty() ? it.key() : prefix + "." + it.key());
            }
        } else if (node.is_string()) {
            out[prefix] = node.get<std::string>();
        } else if (!node.is_null() && !prefix.empty()) {
            out[prefix] = node.dump();
        }
    };
    walk(j, "");
    return out;
}

std::vector<std::string> Settings::apply(const std::map<std::string, std::string>& values) {
    std::vector<std::string> rejected;

    for (const auto& [key, value] : values) {
        long n = 0;
        double d = 0.0;
        bool b = false;
        bool ok = true;

        if (key == "http.timeout_seconds") {
            ok = parse_long(value, n) && n > 0;
            if (ok) http.timeout_seconds = n;
        } else if (key == "http.connect_timeout_seconds") {
            ok = parse_long(value, n) && n > 0;
            if (ok) http.connect_timeout_seconds = n;
        } else if (key == "http.user_agent") {
            http.user_agent = value;
        } else if (key == "probe.timeout_seconds") {
            ok = parse_long(value, n) && n > 0;
            if (ok) probe_timeout_seconds = n;
        } else if (key == "probe.workers") {
            ok = parse_long(value, n) && n > 0 && n <= 256;
            if (ok) probe_workers = static_cast<size_t>(n);
        } else if (key == "probe.include_api_subdomain") {
            ok = parse_bool(value, b);
            if (ok) include_api_subdomain = b;
        } else if (key == "dedup.use_bloom_filter") {
            ok = parse_bool(value, b);
            if (ok) dedup.use_bloom_filter = b;
        } else if (key == "dedup.bloom_capacity") {
            ok = parse_long(value, n) && n > 0;
            if (ok) dedup.bloom_capacity = static_cast<size_t>(n);
        } else if (key == "dedup.bloom_false_positive_rate") {
            ok = parse_double(value, d) && d > 0.0 && d < 1.0;
            if (ok) dedup.bloom_false_positive_rate = d;
        } else if (key == "dedup.max_memory_bytes") {
            ok = parse_long(value, n) && n > 0;
            if (ok) dedup.max_memory_bytes = static_cast<size_t>(n);
        } else if (key == "dedup.recent_cache_size") {
            ok = parse_long(value, n) && n > 0;
            if (ok) dedup.recent_cache_size = static_cast<size_t>(n);
        } else if (key == "browser.webdriver_url") {
            webdriver_url = value;
        } else if (key == "browser.headless") {
            ok = parse_bool(value, b);
            if (ok) headless = b;
        } else if (key == "browser.settle_ms") {
            ok = parse_long(value, n) && n >= 0;
            if (ok) settle_ms = n;
        } else if (key == "login.email") {
            login_email = value;
        } else if (key == "login.password") {
            login_password = value;
        } else if (key == "audit.log_path") {
            audit_log_path = value;
        } else {
            rejected.push_back("unknown key " + key);
            continue;
        }

        if (!ok) {
            rejected.push_back("bad value for " + key + ": " + value);
        }
    }
    return rejected;
}

Settings Settings::parse(const std::string& content, std::vector<std::string>* warnings) {
    Settings s;
    std::map<std::string, std::string> values;

    // Try parsing as JSON first
    json j = json::parse(content, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        values = flatten_json(j);
    } else {
        values = parse_yaml_subset(content);
    }

    auto rejected = s.apply(values);
    if (warnings) {
        warnings->insert(warnings->end(), rejected.begin(), rejected.end());
    }
    return s;
}

Settings Settings::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "Warning: could not open settings file " << path << ", using defaults\n";
        return get_default();
    }

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());

    std::vector<std::string> warnings;
    Settings s = parse(content, &warnings);
    for (const auto& w : warnings) {
        std::cerr << "Warning: " << path << ": " << w << "\n";
    }
    return s;
}

json Settings::to_json() const {
    return {
        {"http", {
            {"timeout_seconds", http.timeout_seconds},
            {"connect_timeout_seconds", http.connect_timeout_seconds},
            {"user_agent", http.user_agent}
        }},
        {"probe", {
            {"timeout_seconds", probe_timeout_seconds},
            {"workers", probe_workers},
            {"include_api_subdomain", include_api_subdomain}
        }},
        {"dedup", {
            {"use_bloom_filter", dedup.use_bloom_filter},
            {"bloom_capacity", dedup.bloom_capacity},
            {"bloom_false_positive_rate", dedup.bloom_false_positive_rate},
            {"max_memory_bytes", dedup.max_memory_bytes},
            {"recent_cache_size", dedup.recent_cache_size}
        }},
        {"browser", {
            {"webdriver_url", webdriver_url},
            {"headless", headless},
            {"settle_ms", settle_ms}
        }},
        {"login", {
            {"email", login_email}
        }},
        {"audit", {
            {"log_path", audit_log_path}
        }}
    };
}

} // namespace config
