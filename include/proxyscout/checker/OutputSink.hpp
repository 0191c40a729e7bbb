#pragma once

#include "proxyscout/proxy/ProxyEndpoint.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace proxyscout::checker {

// Destination of working results, one stream per proxy family. Both
// operations may be called from many threads and may throw.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    // Discards previous content, writing `header` first when given.
    virtual void reset(proxy::ProxyType type, const std::optional<std::string>& header) = 0;
    virtual void append(proxy::ProxyType type, const std::string& line) = 0;
};

class FileOutputSink : public OutputSink {
public:
    FileOutputSink(std::filesystem::path httpPath, std::filesystem::path socks5Path);

    void reset(proxy::ProxyType type, const std::optional<std::string>& header) override;
    void append(proxy::ProxyType type, const std::string& line) override;

    [[nodiscard]] const std::filesystem::path& path(proxy::ProxyType type) const;

private:
    std::mutex& mutexFor(proxy::ProxyType type);

    std::filesystem::path httpPath_;
    std::filesystem::path socks5Path_;
    std::mutex httpMutex_;
    std::mutex socks5Mutex_;
};

} // namespace proxyscout::checker
