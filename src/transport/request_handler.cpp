#include "request_handler.h"
#include "../utils/logger.h"

void RequestHandler::register_route(std::string_view p_method,
                                    std::string_view p_path,
                                    RequestCB p_callback) {
    RouteKey key = {std::string(p_method), std::string(p_path)};
    route_handlers_[key] = std::move(p_callback);
    LOG_INFO("Registered route: " << p_method << " " << p_path);
}

void RequestHandler::handle_request(const InboundRequest& p_request,
                                    ResponseSender p_sender) {
    LOG_DEBUG("Processing " << p_request.method << " " << p_request.target);

    ResponseSender sender = [p_sender](int32_t stream_id, const HttpResponse& response) {
        HttpResponse decorated = response;
        apply_cors_headers(decorated);
        p_sender(stream_id, decorated);
    };

    try
    {
        if (p_request.method == "OPTIONS") {
            sender(p_request.stream_id, HttpResponse(200, "", ""));
            return;
        }

        std::string path = p_request.path();
        auto it = route_handlers_.find({p_request.method, path});
        if (it == route_handlers_.end()) {
            it = route_handlers_.find({"*", path});
        }
        if (it != route_handlers_.end()) {
            it->second(p_request, sender);
            return;
        }
        handle_default_routes(p_request, sender);
    }
    catch(const std::exception& e)
    {
        LOG_ERROR("Error: " << e.what());
        sender(p_request.stream_id,
               HttpResponse(500, create_error_response("Internal server error", e.what()).dump()));
    }
}

json RequestHandler::create_error_response(const std::string& p_error, const std::string& p_message)
{
    return {
        {"error", p_error},
        {"message", p_message}
    };
}

json RequestHandler::create_health_response()
{
    return {
        {"status", "ok"},
        {"service", kServiceName},
        {"version", kServiceVersion},
        {"timestamp", format_utc_timestamp()}
    };
}

void RequestHandler::apply_cors_headers(HttpResponse& p_response)
{
    static const HeaderMap cors = {
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Authorization"},
        {"Access-Control-Allow-Credentials", "false"}
    };
    // Whatever the target sent for these names is kept
    for (const auto& [name, value] : cors) {
        if (!p_response.headers.contains(name)) {
            p_response.headers.add(name, value);
        }
    }
}

void RequestHandler::handle_default_routes(const InboundRequest& p_request,
                                           const ResponseSender& p_sender) {
    std::string path = p_request.path();
    if (path == "/health" || path == "/") {
        p_sender(p_request.stream_id, HttpResponse::json_body(200, create_health_response()));
    }
    else {
        LOG_WARN("No route found for: " << p_request.method << " " << path);
        p_sender(p_request.stream_id, HttpResponse::json_body(404, {{"error", "Not found"}}));
    }
}
