#pragma once

#include "proxyscout/proxy/ProxyEndpoint.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace proxyscout::checker {

struct FamilyProgress {
    std::size_t total{};
    std::size_t checked{};
    std::size_t working{};

    [[nodiscard]] bool done() const noexcept { return checked >= total; }
    // 100 for an empty family.
    [[nodiscard]] double percentage() const noexcept;
};

struct ProgressSnapshot {
    FamilyProgress http;
    FamilyProgress socks5;

    [[nodiscard]] bool complete() const noexcept { return http.done() && socks5.done(); }
};

class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;

    virtual void onProgress(const ProgressSnapshot& snapshot) = 0;
    virtual void onFinished(const ProgressSnapshot& snapshot) = 0;
};

// Polls `source` every `interval` until the snapshot is complete, then
// reports the final snapshot once. stop() ends an unfinished run without
// the final report.
class ProgressReporter {
public:
    ProgressReporter(std::function<ProgressSnapshot()> source,
                     ProgressObserver& observer,
                     std::chrono::milliseconds interval = std::chrono::milliseconds{100});

    void run();
    void stop() noexcept { stopped_ = true; }

private:
    std::function<ProgressSnapshot()> source_;
    ProgressObserver& observer_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> stopped_{false};
};

// "[" + width cells + "]", filled = floor(percentage / 100 * width) clamped to width.
std::string progressBar(double percentage, int width);

} // namespace proxyscout::checker
