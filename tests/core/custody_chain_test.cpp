#include "flowfile/core/custody_chain.hpp"
#include "flowfile/core/time_util.hpp"

#include <gtest/gtest.h>

using flowfile::AttributeSet;
using flowfile::HttpProvenance;

TEST(CustodyChainTest, ShiftMovesExistingLinksDown) {
    AttributeSet attrs{
        {"filename", "a.txt"},
        {"custodyChain.0.time", "2020-01-01T00:00:00Z"},
        {"custodyChain.0.local.hostname", "first"},
        {"custodyChain.1.time", "2019-01-01T00:00:00Z"},
    };
    flowfile::custody_chain_shift(attrs, 0);

    EXPECT_EQ(attrs.get("filename"), "a.txt");
    EXPECT_EQ(attrs.get("custodyChain.1.time"), "2020-01-01T00:00:00Z");
    EXPECT_EQ(attrs.get("custodyChain.1.local.hostname"), "first");
    EXPECT_EQ(attrs.get("custodyChain.2.time"), "2019-01-01T00:00:00Z");
    EXPECT_EQ(attrs.get("custodyChain.0.time"), "1970-01-01T00:00:00Z");
    EXPECT_FALSE(attrs.get("custodyChain.0.local.hostname").empty());
}

TEST(CustodyChainTest, ShiftDropsEntriesWithoutIndex) {
    AttributeSet attrs{{"custodyChain.x.time", "bogus"}, {"custodyChain.", "bogus"}};
    flowfile::custody_chain_shift(attrs, 0);
    EXPECT_FALSE(attrs.has("custodyChain.x.time"));
    EXPECT_FALSE(attrs.has("custodyChain."));
    EXPECT_TRUE(attrs.has("custodyChain.0.time"));
}

TEST(CustodyChainTest, AddHttpFillsLinkZero) {
    AttributeSet attrs;
    flowfile::custody_chain_add_http(attrs, HttpProvenance{"/contentListener", "10.0.0.5", "51234", false});
    EXPECT_EQ(attrs.get("custodyChain.0.request.uri"), "/contentListener");
    EXPECT_EQ(attrs.get("custodyChain.0.source.host"), "10.0.0.5");
    EXPECT_EQ(attrs.get("custodyChain.0.source.port"), "51234");
    EXPECT_EQ(attrs.get("custodyChain.0.protocol"), "HTTP");
}

TEST(TimeUtilTest, FormatsAndParsesRfc3339) {
    EXPECT_EQ(flowfile::format_rfc3339(1577836800), "2020-01-01T00:00:00Z");

    auto utc = flowfile::parse_rfc3339("2020-01-01T00:00:00Z");
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(*utc, 1577836800);

    auto offset = flowfile::parse_rfc3339("2020-01-01T02:00:00.123+02:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*offset, 1577836800);

    EXPECT_FALSE(flowfile::parse_rfc3339("yesterday").has_value());
    EXPECT_FALSE(flowfile::parse_rfc3339("2020-01-01T00:00:00").has_value());
}
