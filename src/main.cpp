#include "proxyscout/checker/OutputSink.hpp"
#include "proxyscout/checker/ProbeTransport.hpp"
#include "proxyscout/checker/ProxyChecker.hpp"
#include "proxyscout/config/AppConfig.hpp"
#include "proxyscout/console/ConsoleRenderer.hpp"
#include "proxyscout/proxy/ProxyList.hpp"
#include "proxyscout/scraper/SourceScraper.hpp"
#include "proxyscout/util/FileUtil.hpp"
#include "proxyscout/util/HttpClient.hpp"
#include "proxyscout/util/Logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {
using namespace proxyscout;

constexpr char kDefaultConfigFile[] = "config.json";
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
    bool strict{false};
    bool detailed{false};
    bool verbose{false};
    bool help{false};
    std::optional<std::filesystem::path> configFile;
};

void printUsage(std::ostream& out) {
    out << "usage: proxyscout [--strict] [--detailed] [--config <path>] [--verbose] [--help]\n"
        << "  --strict     probe geolocation and anonymity through each proxy\n"
        << "  --detailed   write pipe-delimited records (strict mode only)\n"
        << "  --config     JSON configuration file (default config.json)\n"
        << "  --verbose    log at debug level\n";
}

std::optional<CommandLine> parseCommandLine(int argc, char** argv) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--strict") {
            cmd.strict = true;
        } else if (arg == "--detailed") {
            cmd.detailed = true;
        } else if (arg == "--verbose") {
            cmd.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--config" && i + 1 < argc) {
            cmd.configFile = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            cmd.configFile = std::string(arg.substr(9));
        } else {
            std::cerr << "unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    return cmd;
}

config::AppConfig loadSettings(const CommandLine& cmd) {
    config::AppConfig settings;
    if (cmd.configFile) {
        if (!std::filesystem::exists(*cmd.configFile)) {
            throw std::runtime_error("config file " + cmd.configFile->string() + " does not exist");
        }
        settings = config::loadConfigFile(*cmd.configFile);
    } else {
        settings = config::loadConfigFile(kDefaultConfigFile);
    }
    config::applyEnvironment(settings);

    if (cmd.strict) {
        settings.checker.strictCheck = true;
    }
    if (cmd.detailed) {
        settings.checker.detailedOutput = true;
    }
    if (cmd.verbose) {
        settings.logLevel = util::LogLevel::debug;
    }
    config::applyDefaults(settings);
    return settings;
}

std::vector<std::string> loadStoredProxies(const std::filesystem::path& path,
                                           const proxy::NormalizeOptions& options) {
    if (!std::filesystem::exists(path)) {
        return {};
    }
    try {
        auto stored = proxy::extractStoredProxies(util::readLines(path), options);
        util::log(util::LogLevel::info,
                  "loaded " + std::to_string(stored.size()) + " stored proxies from " + path.string());
        return stored;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"Error reading stored proxies: "} + ex.what());
        return {};
    }
}

std::vector<std::string> mergeCandidates(std::vector<std::string> scraped, const std::vector<std::string>& stored) {
    scraped.insert(scraped.end(), stored.begin(), stored.end());
    return proxy::removeDuplicates(scraped);
}

} // namespace

int main(int argc, char** argv) {
    using namespace proxyscout;

    auto cmd = parseCommandLine(argc, argv);
    if (!cmd) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (cmd->help) {
        printUsage(std::cout);
        return EXIT_SUCCESS;
    }

    config::AppConfig settings;
    try {
        settings = loadSettings(*cmd);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return kExitFailure;
    }

    util::initLogging(settings.logLevel, settings.paths.logFile);
    util::log(util::LogLevel::info, "proxyscout starting");

    std::vector<std::string> httpSources;
    std::vector<std::string> socks5Sources;
    try {
        httpSources = util::readLines(settings.paths.sourcesDir / "http.txt");
        socks5Sources = util::readLines(settings.paths.sourcesDir / "socks5.txt");
        std::filesystem::create_directories(settings.paths.outputDir);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Error reading sources: "} + ex.what());
        std::cerr << "Error reading sources: " << ex.what() << "\n";
        return kExitFailure;
    }

    const auto httpOutput = settings.paths.outputDir / "http.txt";
    const auto socks5Output = settings.paths.outputDir / "socks5.txt";

    util::HttpClient httpClient;
    console::ConsoleRenderer renderer(std::cout);
    scraper::SourceScraper sourceScraper(scraper::httpBodyFetcher(httpClient));

    scraper::ScrapeOptions options;
    options.userAgents = settings.scraper.userAgents;
    options.timeout = settings.scraper.timeout;
    options.concurrent = settings.scraper.concurrent;
    options.normalize.looseFallback = settings.scraper.looseFallback;
    options.normalize.enforceRanges = settings.scraper.strictRanges;

    options.type = proxy::ProxyType::http;
    auto httpProxies = sourceScraper.scrapeProxies(httpSources, options, &renderer);
    options.type = proxy::ProxyType::socks5;
    auto socks5Proxies = sourceScraper.scrapeProxies(socks5Sources, options, &renderer);

    httpProxies = mergeCandidates(std::move(httpProxies), loadStoredProxies(httpOutput, options.normalize));
    socks5Proxies = mergeCandidates(std::move(socks5Proxies), loadStoredProxies(socks5Output, options.normalize));

    std::cout << "\nChecking " << httpProxies.size() << " HTTP and " << socks5Proxies.size()
              << " SOCKS5 proxies" << (settings.checker.strictCheck ? " (strict mode)" : "") << "...\n\n";

    checker::HttpProbeTransport transport(httpClient);
    checker::FileOutputSink sink(httpOutput, socks5Output);
    checker::ProxyChecker proxyChecker(settings.checker, transport, sink);
    proxyChecker.setProgressObserver(&renderer);

    std::thread drain([&proxyChecker]() {
        while (auto result = proxyChecker.results().receive()) {
            if (result->working) {
                util::log(util::LogLevel::debug,
                          std::string{"working "} + proxy::toString(result->type) + " proxy " + result->proxy);
            }
        }
    });

    try {
        proxyChecker.checkProxies(httpProxies, socks5Proxies);
    } catch (const std::exception& ex) {
        drain.join();
        std::cerr << "Error checking proxies: " << ex.what() << "\n";
        return kExitFailure;
    }
    drain.join();

    util::log(util::LogLevel::info, "proxyscout finished");
    return EXIT_SUCCESS;
}
