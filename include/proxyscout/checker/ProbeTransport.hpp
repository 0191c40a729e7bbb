#pragma once

#include "proxyscout/proxy/ProxyEndpoint.hpp"
#include "proxyscout/util/HttpClient.hpp"

#include <string>

namespace proxyscout::checker {

struct ProbeResponse {
    int status{};
    std::string body;
};

// Issues a GET to `url` routed through `via`. Any failure to obtain a
// complete response is reported by throwing.
class ProbeTransport {
public:
    virtual ~ProbeTransport() = default;

    virtual ProbeResponse get(const proxy::ProxyEndpoint& via,
                              const std::string& url,
                              const std::string& userAgent,
                              const util::Timeouts& timeouts) = 0;
};

class HttpProbeTransport : public ProbeTransport {
public:
    explicit HttpProbeTransport(util::HttpClient& client);

    ProbeResponse get(const proxy::ProxyEndpoint& via,
                      const std::string& url,
                      const std::string& userAgent,
                      const util::Timeouts& timeouts) override;

private:
    util::HttpClient& client_;
};

} // namespace proxyscout::checker
