#pragma once

#include "proxy_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct TargetDescriptor {
    std::string raw;
    std::string scheme;     // lowercase
    std::string host;       // lowercase, IPv6 literals without brackets
    uint16_t port = 0;      // explicit or scheme default
    std::string path = "/";
    std::string query;      // includes the leading '?', empty when absent

    std::string path_and_query() const { return path + query; }
    // Host as it appears in a Host header, brackets restored for IPv6
    std::string host_header_value() const;
    bool is_tls() const { return scheme == "https"; }
};

struct ValidationResult {
    std::optional<TargetDescriptor> target;
    std::optional<ProxyError> error;  // MissingTarget or InvalidTarget

    bool ok() const { return target.has_value(); }
};

// No scheme restriction here, only syntax: scheme "://" host [":" port] [path] ["?" query]
ValidationResult validate_target(const std::optional<std::string>& p_raw_url);

std::optional<TargetDescriptor> parse_absolute_url(std::string_view p_url);

uint16_t default_port_for(std::string_view p_scheme);

// First occurrence of p_name in the query part of a request target, decoded
std::optional<std::string> find_query_param(std::string_view p_request_target, std::string_view p_name);

std::string percent_decode(std::string_view p_input, bool p_plus_as_space);
