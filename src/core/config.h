#pragma once

#include "../utils/logger.h"

#include <cstdint>
#include <functional>
#include <string>

struct ServerConfig {
    std::string host = "localhost";
    uint16_t port = 3000;
    uint16_t http2_port = 0;        // 0 disables the HTTP/2 listener
    int threads = 4;
    bool use_ssl = false;           // TLS on the HTTP/2 listener
    std::string cert_file = "certs/server.crt";
    std::string key_file = "certs/server.key";
    LogLevel log_level = LogLevel::Info;

    // Reads HOST, PORT, HTTP2_PORT, THREADS, USE_SSL, CERT_FILE, KEY_FILE, LOG_LEVEL.
    // Throws std::invalid_argument for malformed values.
    static ServerConfig from_env();

    using EnvLookup = std::function<const char*(const char*)>;
    static ServerConfig from_lookup(const EnvLookup& p_lookup);
};

uint16_t parse_port(const std::string& p_name, const std::string& p_value);
