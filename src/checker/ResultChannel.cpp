#include "proxyscout/checker/ResultChannel.hpp"

#include <algorithm>

namespace proxyscout::checker {

ResultChannel::ResultChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

bool ResultChannel::publish(CheckResult result) {
    std::unique_lock lock(mutex_);
    notFull_.wait(lock, [this] { return closed_ || buffer_.size() < capacity_; });
    if (closed_) {
        return false;
    }
    buffer_.push_back(std::move(result));
    lock.unlock();
    notEmpty_.notify_one();
    return true;
}

std::optional<CheckResult> ResultChannel::receive() {
    std::unique_lock lock(mutex_);
    notEmpty_.wait(lock, [this] { return closed_ || !buffer_.empty(); });
    if (buffer_.empty()) {
        return std::nullopt;
    }
    CheckResult result = std::move(buffer_.front());
    buffer_.pop_front();
    lock.unlock();
    notFull_.notify_one();
    return result;
}

bool ResultChannel::close() {
    {
        std::scoped_lock lock(mutex_);
        if (closed_) {
            return false;
        }
        closed_ = true;
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
    return true;
}

bool ResultChannel::closed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
}

} // namespace proxyscout::checker
