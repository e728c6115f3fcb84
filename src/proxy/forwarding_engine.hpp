#pragma once

#include "proxy_error.hpp"
#include "target_validator.hpp"
#include "../transport/common.h"
#include "../transport/http_client.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

constexpr const char* kProxyUserAgent = "HttpRelay-Proxy/1.0.0 (Mozilla/5.0)";
constexpr const char* kForwardedAcceptEncoding = "gzip, deflate";
constexpr std::chrono::seconds kRoundTripTimeout{30};

enum class Transport {
    Plain,
    Tls
};

// nullopt for anything but http/https
std::optional<Transport> select_transport(std::string_view p_scheme);

// Inbound headers minus connection-scoped ones, then User-Agent, Host and
// Accept-Encoding overrides appended last.
OutboundRequest build_outbound_request(const InboundRequest& p_inbound, const TargetDescriptor& p_target);

HttpResponse missing_target_response();
HttpResponse invalid_target_response(const std::string& p_raw_target);
HttpResponse unreachable_target_response(const std::string& p_detail);
HttpResponse internal_fault_response(const std::string& p_detail);

struct RelayedResponse {
    HttpResponse response;
    std::optional<ProxyError> error;

    bool ok() const { return !error.has_value(); }
};

using ForwardCallback = std::function<void(const RelayedResponse& p_relayed)>;

class ForwardingEngine {
public:
    explicit ForwardingEngine(boost::asio::io_context& io_context,
                              std::chrono::steady_clock::duration timeout = kRoundTripTimeout);

    // Exactly one network attempt; callback runs once, on the exchange's strand.
    void forward(const InboundRequest& p_inbound, const TargetDescriptor& p_target, ForwardCallback p_callback);

    HttpClient& client() { return *http_client_; }

private:
    std::unique_ptr<HttpClient> http_client_;
};
