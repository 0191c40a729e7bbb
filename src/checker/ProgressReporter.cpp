#include "proxyscout/checker/ProgressReporter.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace proxyscout::checker {
namespace {

constexpr char kFilledCell[] = "█";
constexpr char kEmptyCell[] = "░";

} // namespace

double FamilyProgress::percentage() const noexcept {
    if (total == 0) {
        return 100.0;
    }
    return static_cast<double>(checked) / static_cast<double>(total) * 100.0;
}

ProgressReporter::ProgressReporter(std::function<ProgressSnapshot()> source,
                                   ProgressObserver& observer,
                                   std::chrono::milliseconds interval)
    : source_(std::move(source))
    , observer_(observer)
    , interval_(interval) {}

void ProgressReporter::run() {
    while (!stopped_) {
        auto snapshot = source_();
        if (snapshot.complete()) {
            observer_.onFinished(snapshot);
            return;
        }
        observer_.onProgress(snapshot);
        std::this_thread::sleep_for(interval_);
    }
}

std::string progressBar(double percentage, int width) {
    if (width <= 0) {
        return "[]";
    }
    int filled = static_cast<int>(std::floor(percentage / 100.0 * width));
    filled = std::clamp(filled, 0, width);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? kFilledCell : kEmptyCell;
    }
    bar += "]";
    return bar;
}

} // namespace proxyscout::checker
