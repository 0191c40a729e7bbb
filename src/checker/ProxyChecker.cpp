#include "proxyscout/checker/ProxyChecker.hpp"

#include "proxyscout/util/JsonUtil.hpp"
#include "proxyscout/util/Logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <thread>

namespace proxyscout::checker {
namespace {

using Clock = std::chrono::steady_clock;

constexpr int kStatusOk = 200;
constexpr char kGeoSuccess[] = "success";

boost::json::object parseObject(const std::string& body, const char* what) {
    auto json = util::parseJson(body);
    if (!json.is_object()) {
        throw std::runtime_error(std::string{what} + " response is not a JSON object");
    }
    return std::move(json.as_object());
}

std::chrono::milliseconds elapsedSince(Clock::time_point start) {
    return roundLatency(Clock::now() - start);
}

std::string locationText(const std::optional<ProxyLocation>& location) {
    if (!location) {
        return "Unknown";
    }
    if (!location->city.empty()) {
        return location->city + ", " + location->country;
    }
    return location->country;
}

} // namespace

std::chrono::milliseconds roundLatency(std::chrono::nanoseconds elapsed) {
    return std::chrono::round<std::chrono::milliseconds>(elapsed);
}

std::string formatLatency(std::chrono::milliseconds latency) {
    auto total = latency.count();
    if (total <= 0) {
        return "0s";
    }
    if (total < 1000) {
        return std::to_string(total) + "ms";
    }

    std::string text;
    if (total >= 60'000) {
        text = std::to_string(total / 60'000) + "m";
        total %= 60'000;
    }
    text += std::to_string(total / 1000);
    if (auto millis = total % 1000; millis != 0) {
        std::string fraction = std::to_string(millis);
        fraction.insert(0, 3 - fraction.size(), '0');
        fraction.erase(fraction.find_last_not_of('0') + 1);
        text += "." + fraction;
    }
    return text + "s";
}

ProxyChecker::ProxyChecker(config::CheckerConfig config,
                           ProbeTransport& transport,
                           OutputSink& sink,
                           std::size_t channelCapacity)
    : config_(std::move(config))
    , transport_(transport)
    , sink_(sink)
    , results_(channelCapacity) {}

void ProxyChecker::setProgressObserver(ProgressObserver* observer, std::chrono::milliseconds interval) {
    observer_ = observer;
    progressInterval_ = interval;
}

bool ProxyChecker::detailedOutput() const noexcept {
    return config_.strictCheck && config_.detailedOutput;
}

util::Timeouts ProxyChecker::timeouts() const {
    util::Timeouts timeouts;
    timeouts.connect = config_.connectTimeout;
    timeouts.total = config_.timeout;
    return timeouts;
}

ProgressSnapshot ProxyChecker::snapshot() const {
    std::scoped_lock lock(progressMutex_);
    return progress_;
}

void ProxyChecker::recordResult(proxy::ProxyType type, bool working) {
    std::scoped_lock lock(progressMutex_);
    auto& family = type == proxy::ProxyType::socks5 ? progress_.socks5 : progress_.http;
    ++family.checked;
    if (working) {
        ++family.working;
    }
}

std::string ProxyChecker::formatResult(const CheckResult& result) const {
    if (!detailedOutput()) {
        return result.proxy;
    }
    return result.proxy + "|" + result.proxyIp + "|" + locationText(result.location) + "|" +
           formatLatency(result.latency) + "|" + (result.anonymous ? "Yes" : "No");
}

void ProxyChecker::basicProbe(const proxy::ProxyEndpoint& endpoint, CheckResult& result) {
    const auto start = Clock::now();
    auto response = transport_.get(endpoint, config_.testUrl, config_.userAgent, timeouts());
    result.latency = elapsedSince(start);
    result.working = response.status == kStatusOk;
}

void ProxyChecker::strictProbe(const proxy::ProxyEndpoint& endpoint, CheckResult& result) {
    const auto start = Clock::now();
    auto geo = transport_.get(endpoint, config_.geoUrl, config_.userAgent, timeouts());
    auto geoJson = parseObject(geo.body, "geolocation");
    if (util::stringField(geoJson, "status").value_or("") != kGeoSuccess) {
        util::log(util::LogLevel::debug, "geolocation lookup through " + endpoint.address() + " did not succeed");
        return;
    }

    std::string proxyIp = util::stringField(geoJson, "query").value_or("");
    ProxyLocation location;
    location.country = util::stringField(geoJson, "country").value_or("");
    location.countryCode = util::stringField(geoJson, "countryCode").value_or("");
    location.city = util::stringField(geoJson, "city").value_or("");
    location.region = util::stringField(geoJson, "regionName").value_or("");

    auto echo = transport_.get(endpoint, config_.headersUrl, config_.userAgent, timeouts());
    auto echoJson = parseObject(echo.body, "headers echo");
    bool anonymous = true;
    if (auto headers = echoJson.if_contains("headers")) {
        if (!headers->is_object()) {
            throw std::runtime_error("headers echo carries no header map");
        }
        for (const auto& entry : headers->as_object()) {
            if (!entry.value().is_string()) {
                throw std::runtime_error("headers echo carries a non-string header");
            }
            const auto& value = entry.value().as_string();
            if (std::string_view(value.data(), value.size()).find(proxyIp) != std::string_view::npos) {
                anonymous = false;
                break;
            }
        }
    }

    result.latency = elapsedSince(start);
    result.proxyIp = std::move(proxyIp);
    result.location = std::move(location);
    result.anonymous = anonymous;
    result.working = result.latency < config_.strictLatencyLimit && !result.proxyIp.empty();
}

CheckResult ProxyChecker::checkProxy(const std::string& address, proxy::ProxyType type) {
    CheckResult result;
    result.proxy = address;
    result.type = type;

    proxy::ProxyEndpoint endpoint;
    try {
        endpoint = proxy::parseEndpoint(address, type);
    } catch (const std::invalid_argument& ex) {
        util::log(util::LogLevel::warn,
                  std::string{"Error parsing "} + proxy::toString(type) + " proxy " + address + ": " + ex.what());
        return result;
    }

    try {
        if (config_.strictCheck) {
            strictProbe(endpoint, result);
        } else {
            basicProbe(endpoint, result);
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug,
                  std::string{proxy::toString(type)} + " proxy " + address + " rejected: " + ex.what());
        CheckResult rejected;
        rejected.proxy = address;
        rejected.type = type;
        return rejected;
    }
    return result;
}

void ProxyChecker::runCheck(const std::string& address, proxy::ProxyType type) {
    auto result = checkProxy(address, type);
    if (result.working) {
        try {
            sink_.append(type, formatResult(result));
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn,
                      std::string{"Error saving "} + proxy::toString(type) + " proxy " + address + ": " + ex.what());
        }
    }
    const bool working = result.working;
    if (!results_.publish(std::move(result))) {
        util::log(util::LogLevel::trace, "result stream closed, dropping result for " + address);
    }
    recordResult(type, working);
}

void ProxyChecker::prepareOutput() {
    std::optional<std::string> header;
    if (detailedOutput()) {
        header = kDetailedHeader;
    }
    for (auto type : {proxy::ProxyType::http, proxy::ProxyType::socks5}) {
        try {
            sink_.reset(type, header);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn,
                      std::string{"Error preparing "} + proxy::toString(type) + " output: " + ex.what());
        }
    }
}

void ProxyChecker::runPools(const std::vector<std::string>& httpProxies,
                            const std::vector<std::string>& socks5Proxies) {
    boost::asio::thread_pool httpPool(std::max(1u, config_.concurrentHttp));
    boost::asio::thread_pool socks5Pool(std::max(1u, config_.concurrentSocks5));
    for (const auto& address : httpProxies) {
        boost::asio::post(httpPool, [this, &address]() { runCheck(address, proxy::ProxyType::http); });
    }
    for (const auto& address : socks5Proxies) {
        boost::asio::post(socks5Pool, [this, &address]() { runCheck(address, proxy::ProxyType::socks5); });
    }
    httpPool.join();
    socks5Pool.join();
}

void ProxyChecker::checkProxies(const std::vector<std::string>& httpProxies,
                                const std::vector<std::string>& socks5Proxies) {
    {
        std::scoped_lock lock(progressMutex_);
        progress_ = ProgressSnapshot{};
        progress_.http.total = httpProxies.size();
        progress_.socks5.total = socks5Proxies.size();
    }
    prepareOutput();

    util::log(util::LogLevel::info,
              "checking " + std::to_string(httpProxies.size()) + " HTTP and " +
                  std::to_string(socks5Proxies.size()) + " SOCKS5 candidates" +
                  (config_.strictCheck ? " in strict mode" : ""));

    std::optional<ProgressReporter> progress;
    std::thread reporter;
    try {
        if (observer_) {
            progress.emplace([this]() { return snapshot(); }, *observer_, progressInterval_);
            reporter = std::thread([&progress]() { progress->run(); });
        }
        runPools(httpProxies, socks5Proxies);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"checking aborted: "} + ex.what());
        results_.close();
        if (progress) {
            progress->stop();
        }
        if (reporter.joinable()) {
            reporter.join();
        }
        throw;
    }
    results_.close();

    if (reporter.joinable()) {
        reporter.join();
    }

    auto final = snapshot();
    util::log(util::LogLevel::info,
              "found " + std::to_string(final.http.working) + " working HTTP and " +
                  std::to_string(final.socks5.working) + " working SOCKS5 proxies");
}

} // namespace proxyscout::checker
