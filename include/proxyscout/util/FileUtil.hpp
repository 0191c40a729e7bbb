#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace proxyscout::util {

// Trimmed lines, skipping blank lines and lines starting with '#'.
std::vector<std::string> readLines(const std::filesystem::path& path);

void writeLines(const std::filesystem::path& path, const std::vector<std::string>& lines);
void writeFile(const std::filesystem::path& path, const std::string& content);

// Not synchronized; concurrent writers of one file must serialize themselves.
void appendLine(const std::filesystem::path& path, const std::string& line);

std::string_view trimView(std::string_view input);

} // namespace proxyscout::util
