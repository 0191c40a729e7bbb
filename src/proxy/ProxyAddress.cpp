#include "proxyscout/proxy/ProxyAddress.hpp"

#include "proxyscout/util/JsonUtil.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace proxyscout::proxy {
namespace {

constexpr std::array<std::string_view, 4> kSchemePrefixes{"http://", "https://", "socks4://", "socks5://"};
constexpr std::array<std::string_view, 4> kPortKeys{"port", "proxy_port", "port_num", "port_number"};
constexpr char kDefaultPort[] = "80";

const std::regex& addressPattern() {
    static const std::regex re{R"((\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}):(\d+))"};
    return re;
}

const std::regex& hostPattern() {
    static const std::regex re{R"(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})"};
    return re;
}

const std::regex& portPattern() {
    static const std::regex re{R"(\d{1,5})"};
    return re;
}

bool allDigits(std::string_view value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string_view stripScheme(std::string_view text) {
    for (auto prefix : kSchemePrefixes) {
        if (text.substr(0, prefix.size()) == prefix) {
            text.remove_prefix(prefix.size());
        }
    }
    return text;
}

std::optional<std::string> fromJson(std::string_view text) {
    boost::json::value json;
    try {
        json = util::parseJson(text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (!json.is_object()) {
        return std::nullopt;
    }
    auto data = json.as_object().if_contains("data");
    if (!data || !data->is_array() || data->as_array().empty()) {
        return std::nullopt;
    }
    const auto& first = data->as_array().front();
    if (!first.is_object()) {
        return std::nullopt;
    }
    const auto& entry = first.as_object();
    auto ip = util::stringField(entry, "ip");
    if (!ip || ip->empty()) {
        return std::nullopt;
    }

    std::string port;
    for (auto key : kPortKeys) {
        if (auto value = util::stringField(entry, key); value && !value->empty()) {
            port = *value;
            break;
        }
    }
    if (port.empty()) {
        port = kDefaultPort;
    }
    return *ip + ":" + port;
}

bool withinRanges(std::string_view host, std::string_view port) {
    std::size_t octets = 0;
    std::size_t start = 0;
    while (start <= host.size()) {
        auto dot = host.find('.', start);
        auto part = host.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (part.empty() || part.size() > 3 || !allDigits(part) || std::stoi(std::string(part)) > 255) {
            return false;
        }
        ++octets;
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    if (octets != 4) {
        return false;
    }
    auto value = std::stol(std::string(port));
    return value >= 1 && value <= 65535;
}

} // namespace

std::string normalizeProxy(std::string_view raw, const NormalizeOptions& options) {
    auto text = stripScheme(raw);

    if (!text.empty() && text.front() == '{') {
        if (auto address = fromJson(text)) {
            return *address;
        }
    }

    std::string subject(text);
    std::smatch match;
    if (std::regex_search(subject, match, addressPattern())) {
        return match[1].str() + ":" + match[2].str();
    }

    if (!options.looseFallback) {
        return {};
    }

    std::smatch hostMatch;
    std::smatch portMatch;
    if (std::regex_search(subject, hostMatch, hostPattern()) &&
        std::regex_search(subject, portMatch, portPattern())) {
        return hostMatch.str() + ":" + portMatch.str();
    }
    return {};
}

std::optional<std::string> isValidProxy(std::string_view raw, const NormalizeOptions& options) {
    if (raw.empty()) {
        return std::nullopt;
    }

    auto normalized = normalizeProxy(raw, options);
    if (normalized.empty()) {
        return std::nullopt;
    }

    auto colon = normalized.find(':');
    if (colon == std::string::npos || normalized.find(':', colon + 1) != std::string::npos) {
        return std::nullopt;
    }
    std::string_view host(normalized.data(), colon);
    std::string_view port(normalized.data() + colon + 1, normalized.size() - colon - 1);
    if (host.empty() || port.empty() || port.size() > 5 || !allDigits(port)) {
        return std::nullopt;
    }
    if (options.enforceRanges && !withinRanges(host, port)) {
        return std::nullopt;
    }
    return normalized;
}

} // namespace proxyscout::proxy
