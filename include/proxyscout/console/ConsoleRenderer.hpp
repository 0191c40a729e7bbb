#pragma once

#include "proxyscout/checker/ProgressReporter.hpp"
#include "proxyscout/scraper/SourceScraper.hpp"

#include <mutex>
#include <ostream>

namespace proxyscout::console {

// Terminal rendering of scrape and check progress. Lines are redrawn in
// place with cursor-up / clear-line escape sequences.
class ConsoleRenderer : public checker::ProgressObserver, public scraper::ScrapeObserver {
public:
    explicit ConsoleRenderer(std::ostream& out, int barWidth = 30);

    void onProgress(const checker::ProgressSnapshot& snapshot) override;
    void onFinished(const checker::ProgressSnapshot& snapshot) override;

    void onScrapeStarted(proxy::ProxyType type, std::size_t sources) override;
    void onScrapeProgress(const scraper::ScrapeProgress& progress) override;
    void onScrapeFinished(const scraper::ScrapeProgress& progress) override;

private:
    void writeFamily(const char* name, const checker::FamilyProgress& family);

    std::ostream& out_;
    int barWidth_;
    bool drawn_{false};
    std::mutex mutex_;
};

} // namespace proxyscout::console
