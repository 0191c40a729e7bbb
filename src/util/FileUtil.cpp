#include "proxyscout/util/FileUtil.hpp"

#include <fstream>
#include <stdexcept>

namespace proxyscout::util {

std::string_view trimView(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        auto trimmed = trimView(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        lines.emplace_back(trimmed);
    }
    if (ifs.bad()) {
        throw std::runtime_error("error while reading " + path.string());
    }
    return lines;
}

void writeLines(const std::filesystem::path& path, const std::vector<std::string>& lines) {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("cannot create " + path.string());
    }
    for (const auto& line : lines) {
        ofs << line << '\n';
    }
    if (!ofs) {
        throw std::runtime_error("error while writing " + path.string());
    }
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("cannot create " + path.string());
    }
    ofs << content << '\n';
    if (!ofs) {
        throw std::runtime_error("error while writing " + path.string());
    }
}

void appendLine(const std::filesystem::path& path, const std::string& line) {
    std::ofstream ofs(path, std::ios::out | std::ios::app);
    if (!ofs.is_open()) {
        throw std::runtime_error("cannot open " + path.string() + " for append");
    }
    ofs << line << '\n';
    if (!ofs) {
        throw std::runtime_error("error while appending to " + path.string());
    }
}

} // namespace proxyscout::util
