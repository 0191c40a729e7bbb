#pragma once

#include "proxyscout/proxy/ProxyEndpoint.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace proxyscout::checker {

struct ProxyLocation {
    std::string country;
    std::string countryCode;
    std::string city;
    std::string region;
};

struct CheckResult {
    std::string proxy;
    bool working{false};
    proxy::ProxyType type{proxy::ProxyType::http};
    // Egress address reported by the geolocation probe, strict mode only.
    std::string proxyIp;
    std::chrono::milliseconds latency{0};
    bool anonymous{false};
    std::optional<ProxyLocation> location;
};

} // namespace proxyscout::checker
