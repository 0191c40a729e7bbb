#include "proxyscout/config/AppConfig.hpp"

#include "proxyscout/util/JsonUtil.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace proxyscout::config {
namespace {

constexpr char kDefaultUserAgent[] =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36";
constexpr char kDefaultCheckUrl[] = "http://checkip.amazonaws.com";
constexpr char kDefaultGeoUrl[] = "http://ip-api.com/json";
constexpr char kDefaultHeadersUrl[] = "https://httpbin.org/headers";

constexpr std::chrono::seconds kScraperTimeout{10};
constexpr unsigned int kScraperConcurrent = 10;
constexpr unsigned int kCheckerConcurrent = 100;
constexpr std::chrono::seconds kStrictTimeout{3};
constexpr std::chrono::seconds kStrictConnectTimeout{3};
constexpr std::chrono::seconds kNormalTimeout{10};
constexpr std::chrono::seconds kNormalConnectTimeout{5};
constexpr std::chrono::seconds kStrictLatencyLimit{2};

bool parseBool(const boost::json::value& value) {
    if (value.is_bool()) {
        return value.as_bool();
    }
    if (value.is_int64()) {
        return value.as_int64() != 0;
    }
    if (value.is_string()) {
        auto str = value.as_string();
        std::string lower(str.c_str(), str.size());
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return lower == "true" || lower == "1" || lower == "yes";
    }
    return false;
}

bool parseBoolText(const char* text) {
    return parseBool(boost::json::value(boost::json::string_view(text)));
}

unsigned int parseCount(const boost::json::value& value) {
    if (value.is_int64() && value.as_int64() > 0) {
        return static_cast<unsigned int>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<unsigned int>(value.as_uint64());
    }
    return 0;
}

std::string asString(const boost::json::value& value) {
    if (!value.is_string()) {
        return {};
    }
    const auto& str = value.as_string();
    return std::string(str.c_str(), str.size());
}

std::vector<std::string> asStringList(const boost::json::value& value) {
    std::vector<std::string> items;
    if (!value.is_array()) {
        return items;
    }
    for (const auto& item : value.as_array()) {
        if (auto text = asString(item); !text.empty()) {
            items.push_back(std::move(text));
        }
    }
    return items;
}

ScraperConfig loadScraper(const boost::json::object& obj) {
    ScraperConfig cfg;
    if (auto it = obj.if_contains("timeout")) cfg.timeout = parseDuration(*it);
    if (auto it = obj.if_contains("user_agent")) cfg.userAgent = asString(*it);
    if (auto it = obj.if_contains("user_agents")) cfg.userAgents = asStringList(*it);
    if (auto it = obj.if_contains("concurrent")) cfg.concurrent = parseCount(*it);
    if (auto it = obj.if_contains("loose_fallback")) cfg.looseFallback = parseBool(*it);
    if (auto it = obj.if_contains("strict_ranges")) cfg.strictRanges = parseBool(*it);
    return cfg;
}

CheckerConfig loadChecker(const boost::json::object& obj) {
    CheckerConfig cfg;
    if (auto it = obj.if_contains("timeout")) cfg.timeout = parseDuration(*it);
    if (auto it = obj.if_contains("connect_timeout")) cfg.connectTimeout = parseDuration(*it);
    if (auto it = obj.if_contains("concurrent")) cfg.concurrent = parseCount(*it);
    if (auto it = obj.if_contains("concurrent_http")) cfg.concurrentHttp = parseCount(*it);
    if (auto it = obj.if_contains("concurrent_socks5")) cfg.concurrentSocks5 = parseCount(*it);
    if (auto it = obj.if_contains("check_urls")) cfg.checkUrls = asStringList(*it);
    if (auto it = obj.if_contains("test_url")) cfg.testUrl = asString(*it);
    if (auto it = obj.if_contains("user_agent")) cfg.userAgent = asString(*it);
    if (auto it = obj.if_contains("strict_check")) cfg.strictCheck = parseBool(*it);
    if (auto it = obj.if_contains("detailed_output")) cfg.detailedOutput = parseBool(*it);
    if (auto it = obj.if_contains("geo_url")) cfg.geoUrl = asString(*it);
    if (auto it = obj.if_contains("headers_url")) cfg.headersUrl = asString(*it);
    if (auto it = obj.if_contains("strict_latency_limit")) cfg.strictLatencyLimit = parseDuration(*it);
    return cfg;
}

} // namespace

std::chrono::milliseconds parseDuration(std::string_view text) {
    std::string value(text);
    value.erase(std::remove_if(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); }),
                value.end());
    if (value.empty()) {
        return std::chrono::milliseconds{0};
    }

    std::size_t consumed = 0;
    double amount = 0;
    try {
        amount = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid duration: " + value);
    }
    auto unit = value.substr(consumed);
    double millis = 0;
    if (unit == "ms") {
        millis = amount;
    } else if (unit.empty() || unit == "s") {
        millis = amount * 1000.0;
    } else if (unit == "m") {
        millis = amount * 60'000.0;
    } else {
        throw std::invalid_argument("invalid duration unit: " + value);
    }
    if (millis < 0) {
        throw std::invalid_argument("negative duration: " + value);
    }
    return std::chrono::milliseconds{static_cast<long long>(millis)};
}

std::chrono::milliseconds parseDuration(const boost::json::value& value) {
    if (value.is_int64()) {
        return std::chrono::seconds{std::max<std::int64_t>(0, value.as_int64())};
    }
    if (value.is_double()) {
        return std::chrono::milliseconds{static_cast<long long>(std::max(0.0, value.as_double()) * 1000.0)};
    }
    if (value.is_string()) {
        const auto& str = value.as_string();
        return parseDuration(std::string_view(str.data(), str.size()));
    }
    throw std::invalid_argument("duration must be a number or a string");
}

AppConfig loadConfig(const boost::json::object& json) {
    AppConfig cfg;
    if (auto it = json.if_contains("scraper"); it && it->is_object()) {
        cfg.scraper = loadScraper(it->as_object());
    }
    if (auto it = json.if_contains("checker"); it && it->is_object()) {
        cfg.checker = loadChecker(it->as_object());
    }
    if (auto it = json.if_contains("paths"); it && it->is_object()) {
        const auto& paths = it->as_object();
        if (auto p = paths.if_contains("sources_dir"); p && p->is_string()) cfg.paths.sourcesDir = asString(*p);
        if (auto p = paths.if_contains("output_dir"); p && p->is_string()) cfg.paths.outputDir = asString(*p);
        if (auto p = paths.if_contains("log_file"); p && p->is_string()) cfg.paths.logFile = asString(*p);
    }
    if (auto it = json.if_contains("log_level"); it && it->is_string()) {
        if (auto level = util::parseLogLevel(asString(*it))) {
            cfg.logLevel = *level;
        }
    }
    return cfg;
}

AppConfig loadConfigFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return AppConfig{};
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open config file " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        return AppConfig{};
    }

    boost::json::value json;
    try {
        json = util::parseJson(content);
    } catch (const std::exception& ex) {
        throw std::runtime_error("invalid config file " + path.string() + ": " + ex.what());
    }
    if (!json.is_object()) {
        throw std::runtime_error("config file " + path.string() + " must hold a JSON object");
    }
    return loadConfig(json.as_object());
}

void applyEnvironment(AppConfig& config) {
    if (const char* value = std::getenv("PROXYSCOUT_SCRAPER_CONCURRENT")) {
        auto count = std::strtoul(value, nullptr, 10);
        if (count > 0) {
            config.scraper.concurrent = static_cast<unsigned int>(count);
        }
    }
    if (const char* value = std::getenv("PROXYSCOUT_CHECKER_CONCURRENT")) {
        auto count = std::strtoul(value, nullptr, 10);
        if (count > 0) {
            config.checker.concurrent = static_cast<unsigned int>(count);
        }
    }
    if (const char* value = std::getenv("PROXYSCOUT_TEST_URL")) {
        config.checker.testUrl = value;
    }
    if (const char* value = std::getenv("PROXYSCOUT_STRICT")) {
        config.checker.strictCheck = parseBoolText(value);
    }
    if (const char* value = std::getenv("PROXYSCOUT_DETAILED")) {
        config.checker.detailedOutput = parseBoolText(value);
    }
    if (const char* value = std::getenv("PROXYSCOUT_LOG_LEVEL")) {
        if (auto level = util::parseLogLevel(value)) {
            config.logLevel = *level;
        }
    }
}

void applyDefaults(AppConfig& config) {
    auto& scraper = config.scraper;
    if (scraper.timeout.count() == 0) {
        scraper.timeout = kScraperTimeout;
    }
    if (scraper.userAgent.empty()) {
        scraper.userAgent = kDefaultUserAgent;
    }
    if (scraper.userAgents.empty()) {
        scraper.userAgents = {scraper.userAgent};
    }
    if (scraper.concurrent == 0) {
        scraper.concurrent = kScraperConcurrent;
    }

    auto& checker = config.checker;
    if (checker.timeout.count() == 0) {
        checker.timeout = checker.strictCheck ? kStrictTimeout : kNormalTimeout;
    }
    if (checker.connectTimeout.count() == 0) {
        checker.connectTimeout = checker.strictCheck ? kStrictConnectTimeout : kNormalConnectTimeout;
    }
    if (checker.concurrent == 0) {
        checker.concurrent = kCheckerConcurrent;
    }
    if (checker.concurrentHttp == 0) {
        checker.concurrentHttp = checker.concurrent;
    }
    if (checker.concurrentSocks5 == 0) {
        checker.concurrentSocks5 = checker.concurrent;
    }
    if (checker.checkUrls.empty()) {
        checker.checkUrls = {kDefaultCheckUrl};
    }
    if (checker.testUrl.empty()) {
        checker.testUrl = checker.checkUrls.front();
    }
    if (checker.userAgent.empty()) {
        checker.userAgent = scraper.userAgent;
    }
    if (checker.geoUrl.empty()) {
        checker.geoUrl = kDefaultGeoUrl;
    }
    if (checker.headersUrl.empty()) {
        checker.headersUrl = kDefaultHeadersUrl;
    }
    if (checker.strictLatencyLimit.count() == 0) {
        checker.strictLatencyLimit = kStrictLatencyLimit;
    }
    if (!checker.strictCheck) {
        checker.detailedOutput = false;
    }
}

} // namespace proxyscout::config
