#include "proxyscout/scraper/SourceScraper.hpp"

#include "proxyscout/util/FileUtil.hpp"
#include "proxyscout/util/HttpClient.hpp"
#include "proxyscout/util/Logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <condition_variable>
#include <iterator>
#include <mutex>
#include <string_view>
#include <thread>

namespace proxyscout::scraper {
namespace {

constexpr std::size_t kMaxLoggedUrl = 60;

std::string truncateUrl(const std::string& url) {
    if (url.size() <= kMaxLoggedUrl) {
        return url;
    }
    return url.substr(0, kMaxLoggedUrl - 3) + "...";
}

} // namespace

BodyFetcher httpBodyFetcher(util::HttpClient& client) {
    return [&client](const std::string& url, const std::string& userAgent, std::chrono::milliseconds timeout) {
        std::vector<util::HttpClient::Header> headers{{"User-Agent", userAgent}, {"Accept", "*/*"}};
        util::Timeouts timeouts;
        timeout = std::max(timeout, std::chrono::milliseconds{1});
        timeouts.connect = timeout;
        timeouts.total = timeout;
        auto response = client.fetch(url, headers, timeouts, true);
        if (response.result_int() / 100 != 2) {
            util::log(util::LogLevel::warn,
                      "source " + truncateUrl(url) + " answered with status " + std::to_string(response.result_int()));
        }
        return std::move(response.body());
    };
}

std::vector<std::string> extractProxies(const std::string& body, const proxy::NormalizeOptions& options) {
    std::vector<std::string> proxies;
    std::string_view rest(body);
    while (!rest.empty()) {
        auto newline = rest.find('\n');
        auto line = util::trimView(rest.substr(0, newline));
        rest = newline == std::string_view::npos ? std::string_view{} : rest.substr(newline + 1);
        if (auto normalized = proxy::isValidProxy(line, options)) {
            proxies.push_back(std::move(*normalized));
        }
    }
    return proxies;
}

SourceScraper::SourceScraper(BodyFetcher fetcher)
    : fetcher_(std::move(fetcher)) {}

std::vector<std::string> SourceScraper::scrapeSource(const std::string& url,
                                                     const std::string& userAgent,
                                                     const ScrapeOptions& options) const {
    std::string body;
    try {
        body = fetcher_(url, userAgent, options.timeout);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Error fetching " + url + ": " + ex.what());
        return {};
    }
    auto proxies = extractProxies(body, options.normalize);
    util::log(util::LogLevel::debug,
              "source " + truncateUrl(url) + " yielded " + std::to_string(proxies.size()) + " " +
                  proxy::toString(options.type) + " candidates");
    return proxies;
}

std::vector<std::string> SourceScraper::scrapeProxies(const std::vector<std::string>& urls,
                                                      const ScrapeOptions& options,
                                                      ScrapeObserver* observer) const {
    std::vector<std::string> proxies;
    std::mutex mutex;
    std::condition_variable finished;
    std::size_t completed = 0;

    if (observer) {
        observer->onScrapeStarted(options.type, urls.size());
    }
    auto progress = [&]() {
        ScrapeProgress snapshot;
        snapshot.type = options.type;
        snapshot.found = proxies.size();
        snapshot.completed = completed;
        snapshot.total = urls.size();
        return snapshot;
    };

    std::thread reporter;
    if (observer) {
        reporter = std::thread([&]() {
            std::unique_lock lock(mutex);
            while (completed < urls.size()) {
                if (finished.wait_for(lock, options.reportInterval, [&] { return completed == urls.size(); })) {
                    break;
                }
                observer->onScrapeProgress(progress());
            }
        });
    }

    const std::vector<std::string> fallbackAgents{std::string{}};
    const auto& agents = options.userAgents.empty() ? fallbackAgents : options.userAgents;
    {
        boost::asio::thread_pool pool(std::max(1u, options.concurrent));
        for (std::size_t i = 0; i < urls.size(); ++i) {
            boost::asio::post(pool, [&, i]() {
                auto found = scrapeSource(urls[i], agents[i % agents.size()], options);
                {
                    std::scoped_lock lock(mutex);
                    proxies.insert(proxies.end(),
                                   std::make_move_iterator(found.begin()),
                                   std::make_move_iterator(found.end()));
                    ++completed;
                }
                finished.notify_all();
            });
        }
        pool.join();
    }

    if (reporter.joinable()) {
        reporter.join();
    }
    if (observer) {
        observer->onScrapeFinished(progress());
    }
    util::log(util::LogLevel::info,
              "scraped " + std::to_string(proxies.size()) + " " + proxy::toString(options.type) +
                  " candidates from " + std::to_string(urls.size()) + " sources");
    return proxies;
}

} // namespace proxyscout::scraper
