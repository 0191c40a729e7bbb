#include "proxyscout/scraper/SourceScraper.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace proxyscout::scraper {
namespace {

using Lines = std::vector<std::string>;

class RecordingObserver : public ScrapeObserver {
public:
    void onScrapeStarted(proxy::ProxyType type, std::size_t sources) override {
        std::scoped_lock lock(mutex);
        startedType = type;
        startedSources = sources;
        ++started;
    }
    void onScrapeProgress(const ScrapeProgress& progress) override {
        std::scoped_lock lock(mutex);
        EXPECT_LE(progress.completed, progress.total);
        ++progressed;
    }
    void onScrapeFinished(const ScrapeProgress& progress) override {
        std::scoped_lock lock(mutex);
        last = progress;
        ++finished;
    }

    std::mutex mutex;
    proxy::ProxyType startedType{proxy::ProxyType::http};
    std::size_t startedSources{};
    int started{};
    int progressed{};
    int finished{};
    ScrapeProgress last;
};

struct FakeSources {
    BodyFetcher fetcher() {
        return [this](const std::string& url, const std::string& userAgent, std::chrono::milliseconds) {
            {
                std::scoped_lock lock(mutex);
                agents[url] = userAgent;
            }
            auto it = bodies.find(url);
            if (it == bodies.end()) {
                throw std::runtime_error("connection refused");
            }
            return it->second;
        };
    }

    std::map<std::string, std::string> bodies;
    std::mutex mutex;
    std::map<std::string, std::string> agents;
};

TEST(SourceScraperTest, ExtractsOneCandidatePerLine) {
    std::string body = "1.2.3.4:80\r\nheader line\n  http://5.6.7.8:3128  \n\n9.9.9.9:123456\n";
    EXPECT_EQ((Lines{"1.2.3.4:80", "5.6.7.8:3128"}), extractProxies(body));
    EXPECT_TRUE(extractProxies("").empty());
}

TEST(SourceScraperTest, CollectsFromEverySourceAndSkipsFailures) {
    FakeSources sources;
    sources.bodies["http://a.test/list"] = "1.1.1.1:80\n2.2.2.2:8080\n";
    sources.bodies["http://b.test/list"] = "1.1.1.1:80\n";

    SourceScraper scraper(sources.fetcher());
    ScrapeOptions options;
    options.userAgents = {"agent-0", "agent-1"};
    options.concurrent = 2;

    auto found = scraper.scrapeProxies({"http://a.test/list", "http://down.test/list", "http://b.test/list"}, options);
    std::sort(found.begin(), found.end());
    EXPECT_EQ((Lines{"1.1.1.1:80", "1.1.1.1:80", "2.2.2.2:8080"}), found);
}

TEST(SourceScraperTest, RotatesUserAgentsBySourceIndex) {
    FakeSources sources;
    Lines urls;
    for (int i = 0; i < 5; ++i) {
        urls.push_back("http://s" + std::to_string(i) + ".test/");
        sources.bodies[urls.back()] = "";
    }

    SourceScraper scraper(sources.fetcher());
    ScrapeOptions options;
    options.userAgents = {"ua-a", "ua-b", "ua-c"};
    scraper.scrapeProxies(urls, options);

    ASSERT_EQ(5u, sources.agents.size());
    EXPECT_EQ("ua-a", sources.agents[urls[0]]);
    EXPECT_EQ("ua-b", sources.agents[urls[1]]);
    EXPECT_EQ("ua-c", sources.agents[urls[2]]);
    EXPECT_EQ("ua-a", sources.agents[urls[3]]);
    EXPECT_EQ("ua-b", sources.agents[urls[4]]);
}

TEST(SourceScraperTest, ReportsStartAndFinalTotals) {
    FakeSources sources;
    sources.bodies["http://a.test/"] = "1.1.1.1:80\n2.2.2.2:80\n3.3.3.3:80\n";

    SourceScraper scraper(sources.fetcher());
    ScrapeOptions options;
    options.type = proxy::ProxyType::socks5;
    options.reportInterval = std::chrono::milliseconds{1};

    RecordingObserver observer;
    auto found = scraper.scrapeProxies({"http://a.test/", "http://missing.test/"}, options, &observer);

    EXPECT_EQ(3u, found.size());
    EXPECT_EQ(1, observer.started);
    EXPECT_EQ(proxy::ProxyType::socks5, observer.startedType);
    EXPECT_EQ(2u, observer.startedSources);
    EXPECT_EQ(1, observer.finished);
    EXPECT_EQ(3u, observer.last.found);
    EXPECT_EQ(2u, observer.last.completed);
    EXPECT_EQ(2u, observer.last.total);
    EXPECT_EQ(proxy::ProxyType::socks5, observer.last.type);
}

TEST(SourceScraperTest, FetchesAtMostConcurrentSourcesAtOnce) {
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};
    BodyFetcher fetcher = [&](const std::string&, const std::string&, std::chrono::milliseconds) {
        int now = ++inFlight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
        --inFlight;
        return std::string{"1.1.1.1:80\n"};
    };

    Lines urls;
    for (int i = 0; i < 12; ++i) {
        urls.push_back("http://s" + std::to_string(i) + ".test/");
    }

    SourceScraper scraper(fetcher);
    ScrapeOptions options;
    options.concurrent = 3;
    auto found = scraper.scrapeProxies(urls, options);

    EXPECT_EQ(12u, found.size());
    EXPECT_GE(peak.load(), 1);
    EXPECT_LE(peak.load(), 3);
}

TEST(SourceScraperTest, NoSourcesYieldsNothing) {
    FakeSources sources;
    SourceScraper scraper(sources.fetcher());
    RecordingObserver observer;
    EXPECT_TRUE(scraper.scrapeProxies({}, ScrapeOptions{}, &observer).empty());
    EXPECT_EQ(1, observer.finished);
    EXPECT_EQ(0u, observer.last.total);
}

} // namespace
} // namespace proxyscout::scraper
