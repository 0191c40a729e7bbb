#pragma once

#include "proxyscout/checker/CheckResult.hpp"
#include "proxyscout/checker/OutputSink.hpp"
#include "proxyscout/checker/ProbeTransport.hpp"
#include "proxyscout/checker/ProgressReporter.hpp"
#include "proxyscout/checker/ResultChannel.hpp"
#include "proxyscout/config/AppConfig.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace proxyscout::checker {

inline constexpr char kDetailedHeader[] = "Proxy|IP|Location|Response Time|Anonymous";

// Verifies HTTP and SOCKS5 candidates on two independent bounded pools.
//
// Every candidate is attempted once. Working candidates are appended to the
// output sink as soon as they are confirmed, every outcome is published on
// results(), and the per-family counters are kept in one mutex-guarded
// snapshot that the progress observer polls. results() is closed when
// checkProxies() returns, so a checker serves a single run.
class ProxyChecker {
public:
    ProxyChecker(config::CheckerConfig config,
                 ProbeTransport& transport,
                 OutputSink& sink,
                 std::size_t channelCapacity = 100);

    void setProgressObserver(ProgressObserver* observer,
                             std::chrono::milliseconds interval = std::chrono::milliseconds{100});

    ResultChannel& results() noexcept { return results_; }

    // Blocks until both families are checked. If the worker pools cannot be
    // started the result stream is still closed before the error propagates.
    void checkProxies(const std::vector<std::string>& httpProxies,
                      const std::vector<std::string>& socks5Proxies);

    // Runs the configured validation policy against one candidate without
    // touching counters, sink or result stream.
    CheckResult checkProxy(const std::string& address, proxy::ProxyType type);

    [[nodiscard]] std::string formatResult(const CheckResult& result) const;
    [[nodiscard]] ProgressSnapshot snapshot() const;

private:
    void runPools(const std::vector<std::string>& httpProxies, const std::vector<std::string>& socks5Proxies);
    void runCheck(const std::string& address, proxy::ProxyType type);
    void basicProbe(const proxy::ProxyEndpoint& endpoint, CheckResult& result);
    void strictProbe(const proxy::ProxyEndpoint& endpoint, CheckResult& result);
    void prepareOutput();
    void recordResult(proxy::ProxyType type, bool working);
    [[nodiscard]] bool detailedOutput() const noexcept;
    [[nodiscard]] util::Timeouts timeouts() const;

    config::CheckerConfig config_;
    ProbeTransport& transport_;
    OutputSink& sink_;
    ResultChannel results_;
    ProgressObserver* observer_{nullptr};
    std::chrono::milliseconds progressInterval_{100};

    mutable std::mutex progressMutex_;
    ProgressSnapshot progress_;
};

// Rounds to the nearest millisecond.
std::chrono::milliseconds roundLatency(std::chrono::nanoseconds elapsed);

// Millisecond-rounded rendering: "0s", "850ms", "1.234s", "1m5.2s".
std::string formatLatency(std::chrono::milliseconds latency);

} // namespace proxyscout::checker
