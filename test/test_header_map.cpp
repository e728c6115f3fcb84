#include "proxy/header_map.hpp"

#include <gtest/gtest.h>

TEST(HeaderMapTest, LookupIgnoresCase) {
    HeaderMap headers;
    headers.add("Content-Type", "application/json");

    EXPECT_TRUE(headers.contains("content-type"));
    EXPECT_TRUE(headers.contains("CONTENT-TYPE"));
    EXPECT_EQ(headers.get("content-TYPE").value(), "application/json");
    EXPECT_FALSE(headers.get("Accept").has_value());
}

TEST(HeaderMapTest, KeepsInsertionOrderAndDuplicates) {
    HeaderMap headers;
    headers.add("Set-Cookie", "a=1");
    headers.add("X-Trace", "t");
    headers.add("set-cookie", "b=2");

    ASSERT_EQ(headers.size(), 3u);
    EXPECT_EQ(headers.count("Set-Cookie"), 2u);

    std::vector<std::string> names;
    for (const auto& entry : headers) {
        names.push_back(entry.first);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"Set-Cookie", "X-Trace", "set-cookie"}));
    EXPECT_EQ(headers.get("SET-COOKIE").value(), "a=1");
}

TEST(HeaderMapTest, SetReplacesEveryOccurrence) {
    HeaderMap headers{{"host", "proxy.local"}, {"Accept", "*/*"}, {"Host", "other"}};
    headers.set("HOST", "example.test");

    EXPECT_EQ(headers.count("host"), 1u);
    EXPECT_EQ(headers.get("host").value(), "example.test");
    EXPECT_EQ(headers.begin()->first, "Accept");
}

TEST(HeaderMapTest, EraseReportsRemovedCount) {
    HeaderMap headers{{"A", "1"}, {"a", "2"}, {"B", "3"}};
    EXPECT_EQ(headers.erase("A"), 2u);
    EXPECT_EQ(headers.erase("A"), 0u);
    EXPECT_EQ(headers.size(), 1u);
}

TEST(HeaderMapTest, MergeAppliesOverridesLast) {
    HeaderMap inbound{
        {"Content-Type", "application/json"},
        {"user-agent", "curl/8.0"},
        {"Authorization", "Bearer abc"},
        {"HOST", "proxy.local"}
    };
    HeaderMap overrides{{"User-Agent", "fixed"}, {"Host", "example.test"}};

    HeaderMap merged = inbound.merged_with(overrides);

    HeaderMap expected{
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer abc"},
        {"User-Agent", "fixed"},
        {"Host", "example.test"}
    };
    EXPECT_EQ(merged, expected);
    // inputs untouched
    EXPECT_EQ(inbound.get("host").value(), "proxy.local");
}

TEST(HeaderMapTest, IequalsComparesLength) {
    EXPECT_TRUE(iequals("Keep-Alive", "keep-alive"));
    EXPECT_FALSE(iequals("Keep-Alive", "keep-alive2"));
    EXPECT_TRUE(iequals("", ""));
}
