#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace proxyscout::proxy {

enum class ProxyType {
    http,
    socks5,
};

const char* toString(ProxyType type) noexcept;

struct ProxyEndpoint {
    std::string host;
    std::uint16_t port{};
    ProxyType type{ProxyType::http};

    [[nodiscard]] std::string address() const { return host + ":" + std::to_string(port); }
};

// Throws std::invalid_argument unless `address` is host:port with a port in 1..65535.
ProxyEndpoint parseEndpoint(std::string_view address, ProxyType type);

} // namespace proxyscout::proxy
