#pragma once

#include "proxyscout/util/Logging.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace proxyscout::config {

struct ScraperConfig {
    std::chrono::milliseconds timeout{0};
    std::string userAgent;
    std::vector<std::string> userAgents;
    unsigned int concurrent{0};
    bool looseFallback{true};
    bool strictRanges{false};
};

struct CheckerConfig {
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds connectTimeout{0};
    unsigned int concurrent{0};
    unsigned int concurrentHttp{0};
    unsigned int concurrentSocks5{0};
    std::vector<std::string> checkUrls;
    std::string testUrl;
    std::string userAgent;
    bool strictCheck{false};
    bool detailedOutput{false};
    std::string geoUrl;
    std::string headersUrl;
    std::chrono::milliseconds strictLatencyLimit{0};
};

struct PathConfig {
    std::filesystem::path sourcesDir{"sources"};
    std::filesystem::path outputDir{"out"};
    std::filesystem::path logFile{"proxy_checker.log"};
};

struct AppConfig {
    ScraperConfig scraper;
    CheckerConfig checker;
    PathConfig paths;
    util::LogLevel logLevel{util::LogLevel::info};
};

// Zero or empty fields are left for applyDefaults().
AppConfig loadConfig(const boost::json::object& json);

// Throws std::runtime_error when the file exists but cannot be read or parsed.
// A missing file yields an empty configuration.
AppConfig loadConfigFile(const std::filesystem::path& path);

void applyEnvironment(AppConfig& config);

// Must run after every override, since the strict flag selects the timeouts.
void applyDefaults(AppConfig& config);

// Integers are seconds; strings take an "ms", "s" or "m" suffix.
std::chrono::milliseconds parseDuration(const boost::json::value& value);
std::chrono::milliseconds parseDuration(std::string_view text);

} // namespace proxyscout::config
