#include "forwarding_engine.hpp"
#include "../utils/logger.h"

#include <stdexcept>

std::optional<Transport> select_transport(std::string_view p_scheme) {
    if (p_scheme == "https") {
        return Transport::Tls;
    }
    if (p_scheme == "http") {
        return Transport::Plain;
    }
    return std::nullopt;
}

OutboundRequest build_outbound_request(const InboundRequest& p_inbound, const TargetDescriptor& p_target) {
    auto transport = select_transport(p_target.scheme);
    if (!transport) {
        throw std::invalid_argument("Unsupported scheme: " + p_target.scheme);
    }

    // The body is already buffered, so there is nothing to negotiate with Expect
    HeaderMap base;
    for (const auto& [name, value] : p_inbound.headers) {
        if (is_hop_by_hop_header(name) || iequals(name, "content-length") || iequals(name, "expect")) {
            continue;
        }
        base.add(name, value);
    }

    HeaderMap overrides{
        {"User-Agent", kProxyUserAgent},
        {"Host", p_target.host_header_value()},
        {"Accept-Encoding", kForwardedAcceptEncoding}
    };

    OutboundRequest outbound;
    outbound.method = p_inbound.method;
    outbound.host = p_target.host;
    outbound.port = p_target.port;
    outbound.use_tls = *transport == Transport::Tls;
    outbound.target = p_target.path_and_query();
    outbound.headers = base.merged_with(overrides);
    outbound.body = p_inbound.body;
    return outbound;
}

HttpResponse missing_target_response() {
    return HttpResponse::json_body(400, {
        {"error", "Missing URL parameter"},
        {"usage", "POST /proxy?url=https://external-api-url"},
        {"example", "POST /proxy?url=https://api.example.com/endpoint"}
    });
}

HttpResponse invalid_target_response(const std::string& p_raw_target) {
    return HttpResponse::json_body(400, {
        {"error", "Invalid URL format"},
        {"target", p_raw_target}
    });
}

HttpResponse unreachable_target_response(const std::string& p_detail) {
    return HttpResponse::json_body(502, {
        {"error", "Failed to reach external URL"},
        {"message", p_detail}
    });
}

HttpResponse internal_fault_response(const std::string& p_detail) {
    return HttpResponse::json_body(500, {
        {"error", "Internal server error"},
        {"message", p_detail}
    });
}

ForwardingEngine::ForwardingEngine(boost::asio::io_context& io_context,
                                   std::chrono::steady_clock::duration timeout)
    : http_client_(std::make_unique<HttpClient>(io_context, timeout)) {}

void ForwardingEngine::forward(const InboundRequest& p_inbound, const TargetDescriptor& p_target,
                               ForwardCallback p_callback) {
    if (!select_transport(p_target.scheme)) {
        LOG_WARN("Refusing unsupported scheme '" << p_target.scheme << "' for " << p_target.raw);
        p_callback({invalid_target_response(p_target.raw), ProxyError::InvalidTarget});
        return;
    }

    OutboundRequest outbound;
    try {
        outbound = build_outbound_request(p_inbound, p_target);
    } catch (const std::exception& e) {
        LOG_ERROR("Error: " << e.what());
        p_callback({internal_fault_response(e.what()), ProxyError::InternalFault});
        return;
    }

    LOG_INFO("  -> Forwarding to " << p_target.raw);

    http_client_->send_request(std::move(outbound),
        [callback = std::move(p_callback)](const boost::system::error_code& ec,
                                           const ProxyResponse& response,
                                           const std::string& error) {
            if (ec) {
                LOG_ERROR("  x Error: " << error);
                auto kind = ec == boost::asio::error::timed_out ? ProxyError::TargetTimeout
                                                                : ProxyError::UnreachableTarget;
                callback({unreachable_target_response(error), kind});
                return;
            }

            RelayedResponse relayed;
            try {
                relayed.response.status_code = response.status_code;
                relayed.response.headers = response.headers;
                relayed.response.body = response.body;
            } catch (const std::exception& e) {
                LOG_ERROR("Error: " << e.what());
                callback({internal_fault_response(e.what()), ProxyError::InternalFault});
                return;
            }

            LOG_INFO("  <- Response " << response.status_code << " received");
            callback(relayed);
        });
}
