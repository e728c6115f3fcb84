#pragma once

#include "../proxy/header_map.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <string>
using json = nlohmann::json;

// Request as received by either listener, HTTP/1.1 or HTTP/2
struct InboundRequest {
    std::string method;
    std::string target;     // origin-form path plus query, e.g. /proxy?url=...
    HeaderMap headers;
    std::string body;
    int32_t stream_id = 0;  // HTTP/2 stream, 0 on HTTP/1.1

    std::string path() const { return target.substr(0, target.find('?')); }
};

struct HttpResponse {
    int status_code = 200;
    HeaderMap headers;
    std::string body;

    HttpResponse() = default;
    HttpResponse(int status, const std::string& response_body, const std::string& type = "application/json")
        : status_code(status), body(response_body) {
        if (!type.empty()) {
            headers.set("Content-Type", type);
        }
    }

    static HttpResponse json_body(int status, const json& document) {
        return HttpResponse(status, document.dump());
    }
};

using ResponseSender = std::function<void(int32_t stream_id, const HttpResponse& response)>;
using RequestCB = std::function<void(const InboundRequest& p_request, ResponseSender p_sender)>;
using RouteKey = std::pair<std::string, std::string>; // {method, path}

// Request/response bodies above this are refused rather than buffered
constexpr std::size_t kMaxBodyBytes = 16 * 1024 * 1024;

// Connection-scoped headers that never cross the proxy
inline bool is_hop_by_hop_header(std::string_view p_name) {
    static const char* const hop_by_hop[] = {
        "connection", "keep-alive", "proxy-connection", "te", "trailer", "upgrade", "transfer-encoding"
    };
    for (const char* name : hop_by_hop) {
        if (iequals(p_name, name)) {
            return true;
        }
    }
    return false;
}
