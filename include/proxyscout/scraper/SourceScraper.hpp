#pragma once

#include "proxyscout/proxy/ProxyAddress.hpp"
#include "proxyscout/proxy/ProxyEndpoint.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace proxyscout::util {
class HttpClient;
}

namespace proxyscout::scraper {

struct ScrapeOptions {
    std::vector<std::string> userAgents;
    std::chrono::milliseconds timeout{std::chrono::seconds{10}};
    proxy::ProxyType type{proxy::ProxyType::http};
    unsigned int concurrent{10};
    proxy::NormalizeOptions normalize;
    std::chrono::milliseconds reportInterval{100};
};

struct ScrapeProgress {
    proxy::ProxyType type{proxy::ProxyType::http};
    std::size_t found{};
    std::size_t completed{};
    std::size_t total{};
};

class ScrapeObserver {
public:
    virtual ~ScrapeObserver() = default;

    virtual void onScrapeStarted(proxy::ProxyType type, std::size_t sources) = 0;
    virtual void onScrapeProgress(const ScrapeProgress& progress) = 0;
    virtual void onScrapeFinished(const ScrapeProgress& progress) = 0;
};

// Returns the body of `url`; throws on any request failure.
using BodyFetcher = std::function<std::string(const std::string& url,
                                              const std::string& userAgent,
                                              std::chrono::milliseconds timeout)>;

BodyFetcher httpBodyFetcher(util::HttpClient& client);

class SourceScraper {
public:
    explicit SourceScraper(BodyFetcher fetcher);

    // Blocks until every source has been fetched. A failing source is logged
    // and contributes nothing.
    std::vector<std::string> scrapeProxies(const std::vector<std::string>& urls,
                                           const ScrapeOptions& options,
                                           ScrapeObserver* observer = nullptr) const;

private:
    std::vector<std::string> scrapeSource(const std::string& url,
                                          const std::string& userAgent,
                                          const ScrapeOptions& options) const;

    BodyFetcher fetcher_;
};

// Accepted candidates of one response body, in line order.
std::vector<std::string> extractProxies(const std::string& body, const proxy::NormalizeOptions& options = {});

} // namespace proxyscout::scraper
