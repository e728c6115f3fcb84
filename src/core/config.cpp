#include "config.h"

#include <cstdlib>
#include <stdexcept>

namespace {

long parse_number(const std::string& p_name, const std::string& p_value) {
    size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(p_value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(p_name + " must be a number, got '" + p_value + "'");
    }
    if (consumed != p_value.size()) {
        throw std::invalid_argument(p_name + " must be a number, got '" + p_value + "'");
    }
    return value;
}

}

uint16_t parse_port(const std::string& p_name, const std::string& p_value) {
    long value = parse_number(p_name, p_value);
    if (value < 0 || value > 65535) {
        throw std::invalid_argument(p_name + " out of range: " + p_value);
    }
    return static_cast<uint16_t>(value);
}

ServerConfig ServerConfig::from_env() {
    return from_lookup([](const char* name) { return std::getenv(name); });
}

ServerConfig ServerConfig::from_lookup(const EnvLookup& p_lookup) {
    ServerConfig config;
    auto get = [&p_lookup](const char* name) -> std::string {
        const char* value = p_lookup(name);
        return value ? std::string(value) : std::string();
    };

    if (auto host = get("HOST"); !host.empty()) {
        config.host = host;
    }
    if (auto port = get("PORT"); !port.empty()) {
        config.port = parse_port("PORT", port);
    }
    if (auto port = get("HTTP2_PORT"); !port.empty()) {
        config.http2_port = parse_port("HTTP2_PORT", port);
    }
    if (auto threads = get("THREADS"); !threads.empty()) {
        long value = parse_number("THREADS", threads);
        if (value < 1 || value > 256) {
            throw std::invalid_argument("THREADS out of range: " + threads);
        }
        config.threads = static_cast<int>(value);
    }
    config.use_ssl = get("USE_SSL") == "1";
    if (auto cert = get("CERT_FILE"); !cert.empty()) {
        config.cert_file = cert;
    }
    if (auto key = get("KEY_FILE"); !key.empty()) {
        config.key_file = key;
    }
    if (auto level = get("LOG_LEVEL"); !level.empty()) {
        config.log_level = Logger::parse_level(level);
    }
    return config;
}
