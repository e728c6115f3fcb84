#pragma once

#include "common.h"
#include "../proxy/forwarding_engine.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <functional>

// Entry point for /proxy: validate the url parameter, then hand off to the engine.
class ProxyRequestHandler {
public:
    explicit ProxyRequestHandler(ForwardingEngine& engine);

    void handle_proxy_request(const InboundRequest& request, ResponseSender sender);

private:
    ForwardingEngine& engine_;
};
