#include "proxyscout/util/HttpClient.hpp"
#include "proxyscout/util/Logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string_view>


namespace proxyscout::util {
namespace {
constexpr unsigned kHttpVersion = 11;
constexpr std::uint64_t kMaxBodyBytes = 64ull * 1024 * 1024;

constexpr std::uint8_t kSocksVersion = 0x05;
constexpr std::uint8_t kSocksNoAuth = 0x00;
constexpr std::uint8_t kSocksNoAcceptableMethod = 0xFF;
constexpr std::uint8_t kSocksCmdConnect = 0x01;
constexpr std::uint8_t kSocksAtypIpv4 = 0x01;
constexpr std::uint8_t kSocksAtypDomain = 0x03;
constexpr std::uint8_t kSocksAtypIpv6 = 0x04;

using Clock = std::chrono::steady_clock;

// Drives one asynchronous operation to completion on a private io_context.
// Deadlines set on the beast stream cancel the operation with error::timeout.
template <typename Initiate>
void runOperation(boost::asio::io_context& io, Initiate&& initiate) {
    boost::system::error_code result = boost::asio::error::would_block;
    initiate([&result](const boost::system::error_code& ec, auto&&...) { result = ec; });
    io.restart();
    io.run();
    if (result == boost::asio::error::would_block) {
        throw std::logic_error("asynchronous operation did not complete");
    }
    if (result) {
        throw boost::system::system_error(result);
    }
}

bool isRedirect(boost::beast::http::status status) {
    switch (status) {
    case boost::beast::http::status::moved_permanently:
    case boost::beast::http::status::found:
    case boost::beast::http::status::see_other:
    case boost::beast::http::status::temporary_redirect:
    case boost::beast::http::status::permanent_redirect:
        return true;
    default:
        return false;
    }
}

std::string combineLocation(const ParsedUrl& base, const std::string& location) {
    if (location.empty()) {
        return base.scheme + "://" + base.host + base.target;
    }
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }
    std::string prefix = base.scheme + "://" + base.host;
    if (!base.port.empty() && base.port != "80" && base.port != "443") {
        prefix += ":" + base.port;
    }
    if (location.front() == '/') {
        return prefix + location;
    }
    auto slashPos = base.target.find_last_of('/');
    std::string basePath = slashPos == std::string::npos ? "/" : base.target.substr(0, slashPos + 1);
    return prefix + basePath + location;
}

std::string authorityFrom(const ParsedUrl& parsed) {
    if ((parsed.scheme == "http" && parsed.port == "80") ||
        (parsed.scheme == "https" && parsed.port == "443")) {
        return parsed.host;
    }
    return parsed.host + ":" + parsed.port;
}

std::uint16_t portNumber(const std::string& port) {
    unsigned long value = 0;
    try {
        value = std::stoul(port);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid port: " + port);
    }
    if (value == 0 || value > 65535) {
        throw std::invalid_argument("port out of range: " + port);
    }
    return static_cast<std::uint16_t>(value);
}

// The resolver has no deadline of its own, so a timer cancels the lookup.
boost::asio::ip::tcp::resolver::results_type resolve(boost::asio::io_context& io,
                                                     const std::string& host,
                                                     const std::string& port,
                                                     Clock::time_point deadline) {
    boost::asio::ip::tcp::resolver resolver(io);
    boost::asio::steady_timer timer(io);
    bool timedOut = false;
    timer.expires_at(deadline);
    timer.async_wait([&](const boost::system::error_code& ec) {
        if (!ec) {
            timedOut = true;
            resolver.cancel();
        }
    });

    boost::asio::ip::tcp::resolver::results_type results;
    runOperation(io, [&](auto handler) {
        resolver.async_resolve(host, port,
            [&, handler = std::move(handler)](const boost::system::error_code& ec,
                                              boost::asio::ip::tcp::resolver::results_type found) mutable {
                timer.cancel();
                results = std::move(found);
                handler(timedOut ? boost::system::error_code(boost::beast::error::timeout) : ec);
            });
    });
    return results;
}

void connectTo(boost::asio::io_context& io,
               boost::beast::tcp_stream& stream,
               const std::string& host,
               const std::string& port,
               Clock::time_point deadline) {
    auto results = resolve(io, host, port, deadline);
    stream.expires_at(deadline);
    runOperation(io, [&](auto handler) { stream.async_connect(results, std::move(handler)); });
}

// RFC 1928 greeting offering only "no authentication", then CONNECT.
void socks5Handshake(boost::asio::io_context& io,
                     boost::beast::tcp_stream& stream,
                     const proxy::ProxyEndpoint& proxy,
                     const ParsedUrl& target) {
    std::array<std::uint8_t, 3> greeting{kSocksVersion, 1, kSocksNoAuth};
    runOperation(io, [&](auto handler) {
        boost::asio::async_write(stream, boost::asio::buffer(greeting), std::move(handler));
    });

    std::array<std::uint8_t, 2> choice{};
    runOperation(io, [&](auto handler) {
        boost::asio::async_read(stream, boost::asio::buffer(choice), std::move(handler));
    });
    if (choice[0] != kSocksVersion) {
        throw ProxyError(ProxyError::Type::handshake_failed, 0,
                         "SOCKS proxy " + proxy.address() + " answered with version " + std::to_string(choice[0]));
    }
    if (choice[1] == kSocksNoAcceptableMethod) {
        throw ProxyError(ProxyError::Type::authentication_required, 0,
                         "SOCKS proxy " + proxy.address() + " requires authentication");
    }
    if (choice[1] != kSocksNoAuth) {
        throw ProxyError(ProxyError::Type::handshake_failed, 0,
                         "SOCKS proxy " + proxy.address() + " selected unsupported method " + std::to_string(choice[1]));
    }

    std::vector<std::uint8_t> request{kSocksVersion, kSocksCmdConnect, 0x00};
    boost::system::error_code parseEc;
    auto v4 = boost::asio::ip::make_address_v4(target.host, parseEc);
    if (!parseEc) {
        request.push_back(kSocksAtypIpv4);
        auto bytes = v4.to_bytes();
        request.insert(request.end(), bytes.begin(), bytes.end());
    } else {
        if (target.host.empty() || target.host.size() > 255) {
            throw std::invalid_argument("host name not representable in SOCKS5: " + target.host);
        }
        request.push_back(kSocksAtypDomain);
        request.push_back(static_cast<std::uint8_t>(target.host.size()));
        request.insert(request.end(), target.host.begin(), target.host.end());
    }
    auto port = portNumber(target.port);
    request.push_back(static_cast<std::uint8_t>(port >> 8));
    request.push_back(static_cast<std::uint8_t>(port & 0xFF));
    runOperation(io, [&](auto handler) {
        boost::asio::async_write(stream, boost::asio::buffer(request), std::move(handler));
    });

    std::array<std::uint8_t, 4> reply{};
    runOperation(io, [&](auto handler) {
        boost::asio::async_read(stream, boost::asio::buffer(reply), std::move(handler));
    });
    if (reply[0] != kSocksVersion) {
        throw ProxyError(ProxyError::Type::handshake_failed, 0,
                         "SOCKS proxy " + proxy.address() + " sent a malformed reply");
    }
    if (reply[1] != 0x00) {
        throw ProxyError(ProxyError::Type::connect_failed, reply[1],
                         "SOCKS proxy " + proxy.address() + " refused CONNECT with code " + std::to_string(reply[1]));
    }

    std::size_t remaining = 0;
    switch (reply[3]) {
    case kSocksAtypIpv4:
        remaining = 4 + 2;
        break;
    case kSocksAtypIpv6:
        remaining = 16 + 2;
        break;
    case kSocksAtypDomain: {
        std::array<std::uint8_t, 1> length{};
        runOperation(io, [&](auto handler) {
            boost::asio::async_read(stream, boost::asio::buffer(length), std::move(handler));
        });
        remaining = std::size_t{length[0]} + 2;
        break;
    }
    default:
        throw ProxyError(ProxyError::Type::handshake_failed, 0,
                         "SOCKS proxy " + proxy.address() + " bound an unknown address type");
    }
    std::vector<std::uint8_t> bound(remaining);
    runOperation(io, [&](auto handler) {
        boost::asio::async_read(stream, boost::asio::buffer(bound), std::move(handler));
    });
}

void httpTunnel(boost::asio::io_context& io,
                boost::beast::tcp_stream& stream,
                const proxy::ProxyEndpoint& proxy,
                const ParsedUrl& target) {
    auto authority = target.host + ":" + target.port;
    boost::beast::http::request<boost::beast::http::empty_body> connectRequest{
        boost::beast::http::verb::connect, authority, kHttpVersion};
    connectRequest.set(boost::beast::http::field::host, authority);

    runOperation(io, [&](auto handler) {
        boost::beast::http::async_write(stream, connectRequest, std::move(handler));
    });

    boost::beast::flat_buffer connectBuffer;
    boost::beast::http::response_parser<boost::beast::http::empty_body> connectParser;
    connectParser.skip(true);
    runOperation(io, [&](auto handler) {
        boost::beast::http::async_read(stream, connectBuffer, connectParser, std::move(handler));
    });

    const auto& connectResponse = connectParser.get();
    if (connectResponse.result() == boost::beast::http::status::proxy_authentication_required) {
        throw ProxyError(ProxyError::Type::authentication_required, connectResponse.result_int(),
                         "HTTP proxy " + proxy.address() + " requires authentication");
    }
    if (connectResponse.result() != boost::beast::http::status::ok) {
        throw ProxyError(ProxyError::Type::tunnel_rejected, connectResponse.result_int(),
                         "Proxy CONNECT failed with status " + std::to_string(connectResponse.result_int()));
    }
}

template <typename Stream>
HttpClient::HttpResponse exchange(boost::asio::io_context& io, Stream& stream, HttpClient::HttpRequest& request) {
    runOperation(io, [&](auto handler) {
        boost::beast::http::async_write(stream, request, std::move(handler));
    });

    boost::beast::flat_buffer buffer;
    boost::beast::http::response_parser<boost::beast::http::string_body> parser;
    parser.body_limit(kMaxBodyBytes);
    runOperation(io, [&](auto handler) {
        boost::beast::http::async_read(stream, buffer, parser, std::move(handler));
    });
    return parser.release();
}

void closeQuietly(boost::beast::tcp_stream& stream) {
    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        log(LogLevel::trace, "socket shutdown: " + ec.message());
    }
    stream.socket().close(ec);
}

} // namespace

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }
    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find_first_of("/?", hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    auto colonPos = hostPort.find(':');
    if (colonPos == std::string::npos) {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    } else {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    if (parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    return parsed;
}

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_none);
}

HttpClient::HttpResponse HttpClient::send(HttpRequest request,
                                          const ParsedUrl& parsed,
                                          const Timeouts& timeouts,
                                          const proxy::ProxyEndpoint* viaProxy)
{
    request.version(kHttpVersion);
    request.set(boost::beast::http::field::host, authorityFrom(parsed));

    const auto start = Clock::now();
    const auto deadline = start + timeouts.total;
    const auto connectDeadline = std::min(deadline, start + timeouts.connect);

    boost::asio::io_context io;
    boost::beast::tcp_stream stream(io);

    if (viaProxy) {
        connectTo(io, stream, viaProxy->host, std::to_string(viaProxy->port), connectDeadline);
        if (viaProxy->type == proxy::ProxyType::socks5) {
            socks5Handshake(io, stream, *viaProxy, parsed);
        } else if (parsed.scheme == "https") {
            httpTunnel(io, stream, *viaProxy, parsed);
        } else {
            // Plain HTTP through an HTTP proxy uses the absolute-form target.
            request.target(parsed.scheme + "://" + authorityFrom(parsed) + parsed.target);
        }
    } else {
        connectTo(io, stream, parsed.host, parsed.port, connectDeadline);
    }

    if (parsed.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> tls(std::move(stream), sslContext_);
        if (!SSL_set_tlsext_host_name(tls.native_handle(), parsed.host.c_str())) {
            throw std::runtime_error("Failed to set SNI host name");
        }
        auto& lowest = boost::beast::get_lowest_layer(tls);
        lowest.expires_at(connectDeadline);
        runOperation(io, [&](auto handler) {
            tls.async_handshake(boost::asio::ssl::stream_base::client, std::move(handler));
        });

        lowest.expires_at(deadline);
        auto response = exchange(io, tls, request);
        closeQuietly(lowest);
        return response;
    }

    stream.expires_at(deadline);
    auto response = exchange(io, stream, request);
    closeQuietly(stream);

    if (viaProxy && response.result() == boost::beast::http::status::proxy_authentication_required) {
        throw ProxyError(ProxyError::Type::authentication_required, response.result_int(),
                         "HTTP proxy " + viaProxy->address() + " requires authentication");
    }
    return response;
}

HttpClient::HttpResponse HttpClient::fetch(const std::string& url,
                                           const std::vector<Header>& headers,
                                           const Timeouts& timeouts,
                                           bool followRedirects,
                                           unsigned int maxRedirects,
                                           const proxy::ProxyEndpoint* viaProxy)
{
    std::string currentUrl = url;
    HttpResponse response;

    for (unsigned int redirect = 0; redirect <= maxRedirects; ++redirect) {
        ParsedUrl parsed = parseUrl(currentUrl);
        HttpRequest request{boost::beast::http::verb::get, parsed.target, kHttpVersion};
        for (const auto& header : headers) {
            request.set(header.name, header.value);
        }

        response = send(std::move(request), parsed, timeouts, viaProxy);

        if (!followRedirects || !isRedirect(response.result())) {
            return response;
        }

        auto locationIt = response.base().find(boost::beast::http::field::location);
        if (locationIt == response.base().end()) {
            return response;
        }
        currentUrl = combineLocation(parsed, std::string(locationIt->value()));
        log(LogLevel::trace, "following redirect to " + currentUrl);
    }

    throw std::runtime_error("Maximum redirect count exceeded");
}

} // namespace proxyscout::util
