#include "proxy/target_validator.hpp"

#include <gtest/gtest.h>

TEST(TargetValidatorTest, MissingParameter) {
    auto result = validate_target(std::nullopt);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ProxyError::MissingTarget);
}

TEST(TargetValidatorTest, EmptyParameterCountsAsMissing) {
    auto result = validate_target(std::string());
    EXPECT_EQ(result.error, ProxyError::MissingTarget);
}

TEST(TargetValidatorTest, RejectsMalformedUrls) {
    for (const char* raw : {"not-a-url", "ftp:/bad", "http://", "http:///path", "://host",
                            "http://host:99999/", "http://host:8o/", "http://exa mple.com/",
                            "1http://host/", "http://[::1/", "http://a:b:c/"}) {
        auto result = validate_target(std::string(raw));
        EXPECT_FALSE(result.ok()) << raw;
        EXPECT_EQ(result.error, ProxyError::InvalidTarget) << raw;
    }
}

TEST(TargetValidatorTest, ParsesHttpsWithDefaults) {
    auto result = validate_target(std::string("https://Example.TEST"));
    ASSERT_TRUE(result.ok());
    const auto& target = *result.target;
    EXPECT_EQ(target.scheme, "https");
    EXPECT_EQ(target.host, "example.test");
    EXPECT_EQ(target.port, 443);
    EXPECT_EQ(target.path, "/");
    EXPECT_EQ(target.query, "");
    EXPECT_EQ(target.raw, "https://Example.TEST");
    EXPECT_TRUE(target.is_tls());
}

TEST(TargetValidatorTest, ParsesPortPathAndQuery) {
    auto target = parse_absolute_url("HTTP://user:pw@api.example.test:8080/v1/items?id=7&x=%20#frag");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->scheme, "http");
    EXPECT_EQ(target->host, "api.example.test");
    EXPECT_EQ(target->port, 8080);
    EXPECT_EQ(target->path, "/v1/items");
    EXPECT_EQ(target->query, "?id=7&x=%20");
    EXPECT_EQ(target->path_and_query(), "/v1/items?id=7&x=%20");
    EXPECT_FALSE(target->is_tls());
}

TEST(TargetValidatorTest, QueryWithoutPath) {
    auto target = parse_absolute_url("http://example.test?q=1");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->path_and_query(), "/?q=1");
}

TEST(TargetValidatorTest, Ipv6Literal) {
    auto target = parse_absolute_url("http://[::1]:8081/x");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->host, "::1");
    EXPECT_EQ(target->port, 8081);
    EXPECT_EQ(target->host_header_value(), "[::1]");
}

TEST(TargetValidatorTest, OtherSchemesAreSyntacticallyValid) {
    auto result = validate_target(std::string("ftp://files.example.test/pub"));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.target->scheme, "ftp");
    EXPECT_EQ(result.target->port, 0);
}

TEST(TargetValidatorTest, EmptyPortFallsBackToDefault) {
    auto target = parse_absolute_url("http://example.test:/");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->port, 80);
}

TEST(QueryParamTest, DecodesFirstOccurrence) {
    auto value = find_query_param("/proxy?x=1&url=https%3A%2F%2Fexample.test%2Fa%3Fb%3D1&url=second", "url");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "https://example.test/a?b=1");
}

TEST(QueryParamTest, MissingAndEmpty) {
    EXPECT_FALSE(find_query_param("/proxy", "url").has_value());
    EXPECT_FALSE(find_query_param("/proxy?other=1", "url").has_value());
    EXPECT_EQ(find_query_param("/proxy?url=", "url").value(), "");
    EXPECT_EQ(find_query_param("/proxy?url", "url").value(), "");
}

TEST(QueryParamTest, UnencodedUrlStopsAtAmpersand) {
    EXPECT_EQ(find_query_param("/proxy?url=http://a.test/x?b=1&c=2", "url").value(), "http://a.test/x?b=1");
}

TEST(PercentDecodeTest, PlusAndMalformedEscapes) {
    EXPECT_EQ(percent_decode("a+b%20c", true), "a b c");
    EXPECT_EQ(percent_decode("a+b", false), "a+b");
    EXPECT_EQ(percent_decode("100%", true), "100%");
    EXPECT_EQ(percent_decode("%zz%4", true), "%zz%4");
}
