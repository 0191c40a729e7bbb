#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace proxyscout::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

// An empty path keeps the sink on std::clog.
void initLogging(LogLevel level, const std::filesystem::path& logFile = {});
void log(LogLevel level, const std::string& message);

std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace proxyscout::util
