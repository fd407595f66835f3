#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @file endpoint.h
 * @brief Authenticated API endpoint confirmed by the prober
 */

enum class EndpointType {
    PROFILE,
    PAYMENT,
    ORDERS,
    ADDRESSES,
    WALLET,
    AUTH,
    UNKNOWN
};

inline const char* endpoint_type_name(EndpointType type) {
    switch (type) {
        case EndpointType::PROFILE:   return "profile";
        case EndpointType::PAYMENT:   return "payment";
        case EndpointType::ORDERS:    return "orders";
        case EndpointType::ADDRESSES: return "addresses";
        case EndpointType::WALLET:    return "wallet";
        case EndpointType::AUTH:      return "auth";
        case EndpointType::UNKNOWN:   return "unknown";
    }
    return "unknown";
}

struct Endpoint {
    std::string url;
    std::string method = "GET";
    EndpointType type = EndpointType::UNKNOWN;
    bool tested = false;
    std::optional<bool> accessible;
    std::optional<long> status_code;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string content_type;
    size_t body_bytes = 0;
    std::string source;         // "catalog", "observed" or "login"

    /// Key used for duplicate suppression.
    std::string dedup_key() const { return method + " " + url; }
};
