#include "proxyscout/util/HttpClient.hpp"

#include "TestSupport.hpp"

#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace proxyscout::util {
namespace {

namespace http = boost::beast::http;
using boost::asio::ip::tcp;

struct CapturedRequest {
    std::string method;
    std::string target;
    std::string host;
    std::string userAgent;
};

Timeouts shortTimeouts() {
    Timeouts timeouts;
    timeouts.connect = std::chrono::seconds{2};
    timeouts.total = std::chrono::seconds{3};
    return timeouts;
}

proxy::ProxyEndpoint localProxy(std::uint16_t port, proxy::ProxyType type) {
    proxy::ProxyEndpoint endpoint;
    endpoint.host = "127.0.0.1";
    endpoint.port = port;
    endpoint.type = type;
    return endpoint;
}

// Reads one request from the socket and answers it with `body`.
void serveOnce(tcp::socket& socket, CapturedRequest& captured, const std::string& body) {
    boost::beast::flat_buffer buffer;
    http::request<http::string_body> request;
    http::read(socket, buffer, request);
    captured.method = std::string(request.method_string());
    captured.target = std::string(request.target());
    captured.host = std::string(request[http::field::host]);
    captured.userAgent = std::string(request[http::field::user_agent]);

    http::response<http::string_body> response{http::status::ok, 11};
    response.set(http::field::content_type, "text/plain");
    response.body() = body;
    response.prepare_payload();
    http::write(socket, response);
}

// Waits until the peer goes away.
void waitForClose(tcp::socket& socket) {
    std::array<char, 256> scratch{};
    boost::system::error_code ec;
    while (!ec) {
        socket.read_some(boost::asio::buffer(scratch), ec);
    }
}

TEST(HttpClientTest, ParsesUrls) {
    auto plain = parseUrl("http://example.test/path?q=1");
    EXPECT_EQ("http", plain.scheme);
    EXPECT_EQ("example.test", plain.host);
    EXPECT_EQ("80", plain.port);
    EXPECT_EQ("/path?q=1", plain.target);

    auto secure = parseUrl("HTTPS://example.test:8443");
    EXPECT_EQ("https", secure.scheme);
    EXPECT_EQ("8443", secure.port);
    EXPECT_EQ("/", secure.target);

    EXPECT_EQ("/?x=y", parseUrl("http://example.test?x=y").target);
    EXPECT_THROW(parseUrl("example.test/path"), std::invalid_argument);
    EXPECT_THROW(parseUrl("ftp://example.test/"), std::invalid_argument);
    EXPECT_THROW(parseUrl("http:///path"), std::invalid_argument);
}

TEST(HttpClientTest, HttpProxyReceivesAbsoluteFormTarget) {
    CapturedRequest captured;
    test::OneShotServer server([&captured](tcp::socket& socket) { serveOnce(socket, captured, "203.0.113.7"); });

    HttpClient client;
    auto via = localProxy(server.port(), proxy::ProxyType::http);
    auto response = client.fetch("http://example.test/ip", {{"User-Agent", "checker"}}, shortTimeouts(),
                                 false, 0, &via);
    server.join();

    EXPECT_EQ("", server.error());
    EXPECT_EQ(200u, response.result_int());
    EXPECT_EQ("203.0.113.7", response.body());
    EXPECT_EQ("GET", captured.method);
    EXPECT_EQ("http://example.test/ip", captured.target);
    EXPECT_EQ("example.test", captured.host);
    EXPECT_EQ("checker", captured.userAgent);
}

TEST(HttpClientTest, Socks5ProxyNegotiatesNoAuthConnect) {
    std::vector<std::uint8_t> greeting;
    std::vector<std::uint8_t> connectHeader;
    std::string requestedHost;
    std::uint16_t requestedPort = 0;
    CapturedRequest captured;

    test::OneShotServer server([&](tcp::socket& socket) {
        greeting.resize(3);
        boost::asio::read(socket, boost::asio::buffer(greeting));
        const std::array<std::uint8_t, 2> choice{0x05, 0x00};
        boost::asio::write(socket, boost::asio::buffer(choice));

        connectHeader.resize(5);
        boost::asio::read(socket, boost::asio::buffer(connectHeader));
        requestedHost.resize(connectHeader[4]);
        boost::asio::read(socket, boost::asio::buffer(requestedHost));
        std::array<std::uint8_t, 2> port{};
        boost::asio::read(socket, boost::asio::buffer(port));
        requestedPort = static_cast<std::uint16_t>((port[0] << 8) | port[1]);

        const std::array<std::uint8_t, 10> reply{0x05, 0x00, 0x00, 0x01, 127, 0, 0, 1, 0x1F, 0x90};
        boost::asio::write(socket, boost::asio::buffer(reply));
        serveOnce(socket, captured, "through socks");
    });

    HttpClient client;
    auto via = localProxy(server.port(), proxy::ProxyType::socks5);
    auto response = client.fetch("http://example.test:8081/x", {}, shortTimeouts(),
                                 false, 0, &via);
    server.join();

    EXPECT_EQ("", server.error());
    EXPECT_EQ((std::vector<std::uint8_t>{0x05, 0x01, 0x00}), greeting);
    ASSERT_EQ(5u, connectHeader.size());
    EXPECT_EQ(0x05, connectHeader[0]);
    EXPECT_EQ(0x01, connectHeader[1]);
    EXPECT_EQ(0x00, connectHeader[2]);
    EXPECT_EQ(0x03, connectHeader[3]);
    EXPECT_EQ("example.test", requestedHost);
    EXPECT_EQ(8081, requestedPort);
    EXPECT_EQ("/x", captured.target);
    EXPECT_EQ("example.test:8081", captured.host);
    EXPECT_EQ("through socks", response.body());
}

TEST(HttpClientTest, Socks5ProxyUsesIpv4AddressType) {
    std::array<std::uint8_t, 10> connectRequest{};
    test::OneShotServer server([&](tcp::socket& socket) {
        std::array<std::uint8_t, 3> hello{};
        boost::asio::read(socket, boost::asio::buffer(hello));
        const std::array<std::uint8_t, 2> choice{0x05, 0x00};
        boost::asio::write(socket, boost::asio::buffer(choice));
        boost::asio::read(socket, boost::asio::buffer(connectRequest));
        const std::array<std::uint8_t, 4> refused{0x05, 0x05, 0x00, 0x01};
        boost::asio::write(socket, boost::asio::buffer(refused));
        waitForClose(socket);
    });

    HttpClient client;
    auto via = localProxy(server.port(), proxy::ProxyType::socks5);
    try {
        client.fetch("http://192.0.2.10:80/", {}, shortTimeouts(), false, 0, &via);
        FAIL() << "refused CONNECT must throw";
    } catch (const ProxyError& ex) {
        EXPECT_EQ(ProxyError::Type::connect_failed, ex.type());
        EXPECT_EQ(5, ex.status());
    }
    server.join();

    EXPECT_EQ((std::array<std::uint8_t, 10>{0x05, 0x01, 0x00, 0x01, 192, 0, 2, 10, 0x00, 0x50}), connectRequest);
}

TEST(HttpClientTest, Socks5ProxyDemandingAuthenticationIsReported) {
    test::OneShotServer server([](tcp::socket& socket) {
        std::array<std::uint8_t, 3> hello{};
        boost::asio::read(socket, boost::asio::buffer(hello));
        const std::array<std::uint8_t, 2> choice{0x05, 0xFF};
        boost::asio::write(socket, boost::asio::buffer(choice));
        waitForClose(socket);
    });

    HttpClient client;
    auto via = localProxy(server.port(), proxy::ProxyType::socks5);
    try {
        client.fetch("http://example.test/", {}, shortTimeouts(), false, 0, &via);
        FAIL() << "authentication demand must throw";
    } catch (const ProxyError& ex) {
        EXPECT_EQ(ProxyError::Type::authentication_required, ex.type());
    }
    server.join();
}

TEST(HttpClientTest, SilentProxyTimesOut) {
    test::OneShotServer server([](tcp::socket& socket) { waitForClose(socket); });

    HttpClient client;
    auto via = localProxy(server.port(), proxy::ProxyType::http);
    Timeouts timeouts;
    timeouts.connect = std::chrono::milliseconds{200};
    timeouts.total = std::chrono::milliseconds{300};

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.fetch("http://example.test/", {}, timeouts, false, 0, &via),
                 boost::system::system_error);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{2});
    server.join();
}

TEST(HttpClientTest, FollowsRedirectsThroughTheSameProxy) {
    boost::asio::io_context io;
    tcp::acceptor acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
    const auto port = acceptor.local_endpoint().port();

    std::vector<std::string> targets;
    std::string failure;
    std::thread proxyThread([&]() {
        try {
            for (int i = 0; i < 2; ++i) {
                tcp::socket socket(io);
                acceptor.accept(socket);
                boost::beast::flat_buffer buffer;
                http::request<http::string_body> request;
                http::read(socket, buffer, request);
                targets.emplace_back(request.target());

                http::response<http::string_body> response;
                response.version(11);
                if (i == 0) {
                    response.result(http::status::found);
                    response.set(http::field::location, "/final");
                } else {
                    response.result(http::status::ok);
                    response.body() = "done";
                }
                response.prepare_payload();
                http::write(socket, response);
            }
        } catch (const std::exception& ex) {
            failure = ex.what();
        }
    });

    HttpClient client;
    auto via = localProxy(port, proxy::ProxyType::http);
    auto response = client.fetch("http://example.test/start", {}, shortTimeouts(), true, 5, &via);
    proxyThread.join();

    EXPECT_EQ("", failure);
    EXPECT_EQ("done", response.body());
    EXPECT_EQ((std::vector<std::string>{"http://example.test/start", "http://example.test/final"}), targets);
}

TEST(HttpClientTest, DirectFetchResolvesHostNames) {
    CapturedRequest captured;
    test::OneShotServer server([&captured](tcp::socket& socket) { serveOnce(socket, captured, "1.2.3.4:80\n"); });

    HttpClient client;
    const auto port = std::to_string(server.port());
    auto response = client.fetch("http://localhost:" + port + "/list", {{"User-Agent", "scraper"}}, shortTimeouts());
    server.join();

    EXPECT_EQ("", server.error());
    EXPECT_EQ("1.2.3.4:80\n", response.body());
    EXPECT_EQ("/list", captured.target);
    EXPECT_EQ("localhost:" + port, captured.host);
}

TEST(HttpClientTest, ExpiredDeadlineBoundsResolutionAndConnect) {
    boost::asio::io_context io;
    tcp::acceptor acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
    const auto port = std::to_string(acceptor.local_endpoint().port());

    HttpClient client;
    Timeouts timeouts;
    timeouts.connect = std::chrono::milliseconds{0};
    timeouts.total = std::chrono::milliseconds{0};

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.fetch("http://localhost:" + port + "/", {}, timeouts), boost::system::system_error);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{1});
}

// Reads the CONNECT request and answers it with `status`.
void rejectTunnel(tcp::socket& socket, CapturedRequest& captured, http::status status) {
    boost::beast::flat_buffer buffer;
    http::request<http::empty_body> request;
    http::read(socket, buffer, request);
    captured.method = std::string(request.method_string());
    captured.target = std::string(request.target());
    captured.host = std::string(request[http::field::host]);

    http::response<http::empty_body> response{status, 11};
    response.prepare_payload();
    http::write(socket, response);
    waitForClose(socket);
}

TEST(HttpClientTest, HttpsThroughHttpProxyOpensConnectTunnel) {
    CapturedRequest captured;
    test::OneShotServer server([&captured](tcp::socket& socket) {
        rejectTunnel(socket, captured, http::status::forbidden);
    });

    HttpClient client;
    auto via = localProxy(server.port(), proxy::ProxyType::http);
    try {
        client.fetch("https://secure.example.test/json", {}, shortTimeouts(), false, 0, &via);
        FAIL() << "rejected tunnel must throw";
    } catch (const ProxyError& ex) {
        EXPECT_EQ(ProxyError::Type::tunnel_rejected, ex.type());
        EXPECT_EQ(403, ex.status());
    }
    server.join();

    EXPECT_EQ("", server.error());
    EXPECT_EQ("CONNECT", captured.method);
    EXPECT_EQ("secure.example.test:443", captured.target);
    EXPECT_EQ("secure.example.test:443", captured.host);
}

TEST(HttpClientTest, ConnectTunnelDemandingAuthenticationIsReported) {
    CapturedRequest captured;
    test::OneShotServer server([&captured](tcp::socket& socket) {
        rejectTunnel(socket, captured, http::status::proxy_authentication_required);
    });

    HttpClient client;
    auto via = localProxy(server.port(), proxy::ProxyType::http);
    try {
        client.fetch("https://secure.example.test:8443/", {}, shortTimeouts(), false, 0, &via);
        FAIL() << "authentication demand must throw";
    } catch (const ProxyError& ex) {
        EXPECT_EQ(ProxyError::Type::authentication_required, ex.type());
        EXPECT_EQ(407, ex.status());
    }
    server.join();

    EXPECT_EQ("", server.error());
    EXPECT_EQ("secure.example.test:8443", captured.target);
}

TEST(HttpClientTest, RefusedConnectionThrows) {
    std::uint16_t port = 0;
    {
        boost::asio::io_context io;
        tcp::acceptor acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
        port = acceptor.local_endpoint().port();
    }

    HttpClient client;
    auto via = localProxy(port, proxy::ProxyType::http);
    EXPECT_THROW(client.fetch("http://example.test/", {}, shortTimeouts(), false, 0, &via),
                 boost::system::system_error);
}

} // namespace
} // namespace proxyscout::util
