#include "proxyscout/proxy/ProxyList.hpp"

#include "proxyscout/util/FileUtil.hpp"

#include <unordered_set>

namespace proxyscout::proxy {

std::vector<std::string> removeDuplicates(const std::vector<std::string>& proxies) {
    std::unordered_set<std::string> seen;
    seen.reserve(proxies.size());
    std::vector<std::string> result;
    result.reserve(proxies.size());

    for (const auto& proxy : proxies) {
        if (seen.insert(proxy).second) {
            result.push_back(proxy);
        }
    }
    return result;
}

std::vector<std::string> extractStoredProxies(const std::vector<std::string>& lines,
                                              const NormalizeOptions& options) {
    NormalizeOptions stored = options;
    stored.looseFallback = false;

    std::vector<std::string> proxies;
    proxies.reserve(lines.size());
    for (const auto& line : lines) {
        std::string_view view(line);
        auto field = util::trimView(view.substr(0, view.find('|')));
        if (auto address = isValidProxy(field, stored)) {
            proxies.push_back(std::move(*address));
        }
    }
    return proxies;
}

} // namespace proxyscout::proxy
