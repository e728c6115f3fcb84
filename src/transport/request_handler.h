#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <map>

#include "../utils/logger.h"
#include "common.h"

constexpr const char* kServiceName = "HTTP Relay Proxy";
constexpr const char* kServiceVersion = "1.0.0";

// Routes inbound requests by path and decorates every answer with CORS headers.
class RequestHandler {
    public:
        RequestHandler() = default;

        // p_method "*" matches any method
        void register_route(std::string_view p_method,
                            std::string_view p_path,
                            RequestCB p_callback);
        void handle_request(const InboundRequest& p_request,
                            ResponseSender p_sender);

        static json create_error_response(const std::string& p_error, const std::string& p_message);
        static json create_health_response();
        static void apply_cors_headers(HttpResponse& p_response);
    private:
        void handle_default_routes(const InboundRequest& p_request,
                                   const ResponseSender& p_sender);

    private:
        std::map<RouteKey, RequestCB> route_handlers_;
};
