#pragma once

#include "proxyscout/proxy/ProxyEndpoint.hpp"

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace proxyscout::util {

class ProxyError : public std::runtime_error {
public:
    enum class Type {
        connect_failed,
        handshake_failed,
        authentication_required,
        tunnel_rejected,
    };

    ProxyError(Type type, int status, const std::string& message)
        : std::runtime_error(message)
        , type_(type)
        , status_(status) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

    // HTTP status of a rejected tunnel, SOCKS5 reply code, or 0.
    [[nodiscard]] int status() const noexcept { return status_; }

private:
    Type type_;
    int status_;
};

struct Timeouts {
    // Establishing the connection, including the proxy handshake.
    std::chrono::milliseconds connect{std::chrono::seconds{5}};
    // The whole exchange, connect included.
    std::chrono::milliseconds total{std::chrono::seconds{10}};
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

ParsedUrl parseUrl(const std::string& url);

class HttpClient {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    struct Header {
        std::string name;
        std::string value;
    };

    HttpClient();

    // Issues a GET and blocks the calling thread. Each call owns its
    // io_context, so one client may be shared by any number of worker threads.
    HttpResponse fetch(const std::string& url,
                       const std::vector<Header>& headers,
                       const Timeouts& timeouts,
                       bool followRedirects = false,
                       unsigned int maxRedirects = 5,
                       const proxy::ProxyEndpoint* viaProxy = nullptr);

private:
    HttpResponse send(HttpRequest request,
                      const ParsedUrl& parsed,
                      const Timeouts& timeouts,
                      const proxy::ProxyEndpoint* viaProxy);

    boost::asio::ssl::context sslContext_;
};

} // namespace proxyscout::util
