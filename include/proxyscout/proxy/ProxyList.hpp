#pragma once

#include "proxyscout/proxy/ProxyAddress.hpp"

#include <string>
#include <vector>

namespace proxyscout::proxy {

// Keeps the first occurrence of every value, in input order.
std::vector<std::string> removeDuplicates(const std::vector<std::string>& proxies);

// Recovers candidate addresses from previously written output lines, bare or
// pipe-delimited. Header rows and unparsable lines are dropped.
std::vector<std::string> extractStoredProxies(const std::vector<std::string>& lines,
                                              const NormalizeOptions& options = {});

} // namespace proxyscout::proxy
