#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace proxyscout::proxy {

struct NormalizeOptions {
    // Combine the first dotted quad and the first digit run when no ip:port
    // pattern is present. May pair unrelated substrings.
    bool looseFallback{true};
    // Require octets <= 255 and a port in 1..65535.
    bool enforceRanges{false};
};

// Canonical "ip:port" or an empty string when nothing usable was found.
std::string normalizeProxy(std::string_view raw, const NormalizeOptions& options = {});

// Normalized candidate address, or nullopt if it fails validation. Without
// enforceRanges the port is only checked for being 1-5 ASCII digits.
std::optional<std::string> isValidProxy(std::string_view raw, const NormalizeOptions& options = {});

} // namespace proxyscout::proxy
