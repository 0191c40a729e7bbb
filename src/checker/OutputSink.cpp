#include "proxyscout/checker/OutputSink.hpp"

#include "proxyscout/util/FileUtil.hpp"

#include <fstream>
#include <stdexcept>

namespace proxyscout::checker {

FileOutputSink::FileOutputSink(std::filesystem::path httpPath, std::filesystem::path socks5Path)
    : httpPath_(std::move(httpPath))
    , socks5Path_(std::move(socks5Path)) {}

const std::filesystem::path& FileOutputSink::path(proxy::ProxyType type) const {
    return type == proxy::ProxyType::socks5 ? socks5Path_ : httpPath_;
}

std::mutex& FileOutputSink::mutexFor(proxy::ProxyType type) {
    return type == proxy::ProxyType::socks5 ? socks5Mutex_ : httpMutex_;
}

void FileOutputSink::reset(proxy::ProxyType type, const std::optional<std::string>& header) {
    std::scoped_lock lock(mutexFor(type));
    if (header) {
        util::writeFile(path(type), *header);
        return;
    }
    std::ofstream truncate(path(type), std::ios::out | std::ios::trunc);
    if (!truncate.is_open()) {
        throw std::runtime_error("cannot truncate " + path(type).string());
    }
}

void FileOutputSink::append(proxy::ProxyType type, const std::string& line) {
    std::scoped_lock lock(mutexFor(type));
    util::appendLine(path(type), line);
}

} // namespace proxyscout::checker
