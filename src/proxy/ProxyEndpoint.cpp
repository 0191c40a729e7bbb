#include "proxyscout/proxy/ProxyEndpoint.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace proxyscout::proxy {

const char* toString(ProxyType type) noexcept {
    switch (type) {
    case ProxyType::http: return "HTTP";
    case ProxyType::socks5: return "SOCKS5";
    }
    return "Unknown";
}

ProxyEndpoint parseEndpoint(std::string_view address, ProxyType type) {
    auto colon = address.find(':');
    if (colon == std::string_view::npos || address.find(':', colon + 1) != std::string_view::npos) {
        throw std::invalid_argument("proxy address must be host:port: " + std::string(address));
    }
    auto host = address.substr(0, colon);
    auto port = address.substr(colon + 1);
    if (host.empty() || port.empty() || port.size() > 5 ||
        !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("malformed proxy address: " + std::string(address));
    }

    unsigned long value = std::stoul(std::string(port));
    if (value == 0 || value > 65535) {
        throw std::invalid_argument("proxy port out of range: " + std::string(address));
    }

    ProxyEndpoint endpoint;
    endpoint.host = std::string(host);
    endpoint.port = static_cast<std::uint16_t>(value);
    endpoint.type = type;
    return endpoint;
}

} // namespace proxyscout::proxy
