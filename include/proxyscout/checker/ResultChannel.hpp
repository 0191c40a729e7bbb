#pragma once

#include "proxyscout/checker/CheckResult.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace proxyscout::checker {

// Bounded multi-producer queue of check results. Closing is idempotent;
// receivers drain what is buffered before seeing the end of the stream.
class ResultChannel {
public:
    explicit ResultChannel(std::size_t capacity = 100);

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    // Blocks while the buffer is full. Returns false once the channel is closed.
    bool publish(CheckResult result);

    // Blocks until a result is available; nullopt after close() and drain.
    std::optional<CheckResult> receive();

    // True only for the call that actually closed the channel.
    bool close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<CheckResult> buffer_;
    bool closed_{false};
};

} // namespace proxyscout::checker
