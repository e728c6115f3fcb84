#include "core/config.h"

#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <string>

namespace {

ServerConfig::EnvLookup lookup_from(const std::map<std::string, std::string>& env) {
    return [env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };
}

}

TEST(ServerConfigTest, Defaults) {
    auto config = ServerConfig::from_lookup(lookup_from({}));
    EXPECT_EQ(config.host, "localhost");
    EXPECT_EQ(config.port, 3000);
    EXPECT_EQ(config.http2_port, 0);
    EXPECT_EQ(config.threads, 4);
    EXPECT_FALSE(config.use_ssl);
    EXPECT_EQ(config.log_level, LogLevel::Info);
}

TEST(ServerConfigTest, Overrides) {
    auto config = ServerConfig::from_lookup(lookup_from({
        {"HOST", "0.0.0.0"}, {"PORT", "8080"}, {"HTTP2_PORT", "8443"}, {"THREADS", "2"},
        {"USE_SSL", "1"}, {"CERT_FILE", "/etc/relay/cert.pem"}, {"KEY_FILE", "/etc/relay/key.pem"},
        {"LOG_LEVEL", "debug"}
    }));
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.http2_port, 8443);
    EXPECT_EQ(config.threads, 2);
    EXPECT_TRUE(config.use_ssl);
    EXPECT_EQ(config.cert_file, "/etc/relay/cert.pem");
    EXPECT_EQ(config.key_file, "/etc/relay/key.pem");
    EXPECT_EQ(config.log_level, LogLevel::Debug);
}

TEST(ServerConfigTest, MalformedValuesThrow) {
    EXPECT_THROW(ServerConfig::from_lookup(lookup_from({{"PORT", "eighty"}})), std::invalid_argument);
    EXPECT_THROW(ServerConfig::from_lookup(lookup_from({{"PORT", "70000"}})), std::invalid_argument);
    EXPECT_THROW(ServerConfig::from_lookup(lookup_from({{"PORT", "80x"}})), std::invalid_argument);
    EXPECT_THROW(ServerConfig::from_lookup(lookup_from({{"THREADS", "0"}})), std::invalid_argument);
    EXPECT_THROW(ServerConfig::from_lookup(lookup_from({{"LOG_LEVEL", "verbose"}})), std::invalid_argument);
}

TEST(ServerConfigTest, UseSslRequiresExactOne) {
    EXPECT_FALSE(ServerConfig::from_lookup(lookup_from({{"USE_SSL", "true"}})).use_ssl);
}
