#include "proxyscout/util/Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace proxyscout::util {
namespace {

struct LogSink {
    std::mutex mutex;
    std::atomic<LogLevel> level{LogLevel::info};
    std::ofstream file;
};

LogSink& sink() {
    static LogSink instance;
    return instance;
}

const char* levelName(LogLevel level) {
    switch (level) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

// Local wall-clock time as "YYYY-MM-DD HH:MM:SS.mmm".
std::string timestamp() {
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto whole = floor<seconds>(now);
    const auto millis = duration_cast<milliseconds>(now - whole).count();

    std::time_t t = system_clock::to_time_t(whole);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

} // namespace

void initLogging(LogLevel level, const std::filesystem::path& logFile) {
    auto& s = sink();
    std::scoped_lock lock(s.mutex);
    s.level = level;
    if (s.file.is_open()) {
        s.file.close();
    }
    if (logFile.empty()) {
        return;
    }
    s.file.open(logFile, std::ios::out | std::ios::app);
    if (!s.file.is_open()) {
        std::clog << "cannot open log file " << logFile.string() << ", logging to stderr\n";
    }
}

void log(LogLevel level, const std::string& message) {
    auto& s = sink();
    if (static_cast<int>(level) < static_cast<int>(s.level.load())) {
        return;
    }

    std::string line = timestamp() + " [" + levelName(level) + "] " + message + '\n';

    std::scoped_lock lock(s.mutex);
    if (s.file.is_open()) {
        s.file << line;
        s.file.flush();
    } else {
        std::clog << line;
    }
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "trace") return LogLevel::trace;
    if (lower == "debug") return LogLevel::debug;
    if (lower == "info") return LogLevel::info;
    if (lower == "warn" || lower == "warning") return LogLevel::warn;
    if (lower == "error") return LogLevel::error;
    return std::nullopt;
}

} // namespace proxyscout::util
