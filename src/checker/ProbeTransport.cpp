#include "proxyscout/checker/ProbeTransport.hpp"

#include <vector>

namespace proxyscout::checker {

HttpProbeTransport::HttpProbeTransport(util::HttpClient& client)
    : client_(client) {}

ProbeResponse HttpProbeTransport::get(const proxy::ProxyEndpoint& via,
                                      const std::string& url,
                                      const std::string& userAgent,
                                      const util::Timeouts& timeouts) {
    std::vector<util::HttpClient::Header> headers{{"User-Agent", userAgent}};
    auto response = client_.fetch(url, headers, timeouts, true, 5, &via);

    ProbeResponse probe;
    probe.status = static_cast<int>(response.result_int());
    probe.body = std::move(response.body());
    return probe;
}

} // namespace proxyscout::checker
