#include "proxyscout/console/ConsoleRenderer.hpp"

#include <cmath>

namespace proxyscout::console {
namespace {

constexpr char kCursorUpClear[] = "\033[1A\033[K";
constexpr char kClearLine[] = "\r\033[K";

} // namespace

ConsoleRenderer::ConsoleRenderer(std::ostream& out, int barWidth)
    : out_(out)
    , barWidth_(barWidth) {}

void ConsoleRenderer::writeFamily(const char* name, const checker::FamilyProgress& family) {
    const double percentage = family.percentage();
    out_ << kClearLine << name << " [" << family.checked << "/" << family.total << "] - Working: "
         << family.working << " " << checker::progressBar(percentage, barWidth_) << " "
         << static_cast<int>(std::lround(percentage)) << "%";
}

void ConsoleRenderer::onProgress(const checker::ProgressSnapshot& snapshot) {
    std::scoped_lock lock(mutex_);
    if (drawn_) {
        out_ << kCursorUpClear;
    }
    writeFamily("HTTP", snapshot.http);
    out_ << "\n";
    writeFamily("SOCKS5", snapshot.socks5);
    out_.flush();
    drawn_ = true;
}

void ConsoleRenderer::onFinished(const checker::ProgressSnapshot& snapshot) {
    std::scoped_lock lock(mutex_);
    if (drawn_) {
        out_ << kCursorUpClear;
    }
    writeFamily("HTTP", snapshot.http);
    out_ << "\n";
    writeFamily("SOCKS5", snapshot.socks5);
    out_ << "\n\n✓ Found " << snapshot.http.working << " working HTTP proxies\n"
         << "✓ Found " << snapshot.socks5.working << " working SOCKS5 proxies\n";
    out_.flush();
    drawn_ = false;
}

void ConsoleRenderer::onScrapeStarted(proxy::ProxyType type, std::size_t sources) {
    std::scoped_lock lock(mutex_);
    out_ << "Starting " << proxy::toString(type) << " proxy scraping from " << sources << " sources...\n";
    out_.flush();
}

void ConsoleRenderer::onScrapeProgress(const scraper::ScrapeProgress& progress) {
    std::scoped_lock lock(mutex_);
    out_ << kClearLine << "✓ Scraped " << progress.found << " " << proxy::toString(progress.type) << " proxies ["
         << progress.completed << "/" << progress.total << "]";
    out_.flush();
}

void ConsoleRenderer::onScrapeFinished(const scraper::ScrapeProgress& progress) {
    std::scoped_lock lock(mutex_);
    out_ << kClearLine << "✓ Scraped " << progress.found << " " << proxy::toString(progress.type) << " proxies ["
         << progress.completed << "/" << progress.total << "]\n";
    out_.flush();
}

} // namespace proxyscout::console
