// =============================================================================
// logq - Address Matcher Tests
// =============================================================================

#include "logq/query/matchers.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace logq::query {
namespace {

IpMatcher ipRules(const std::vector<std::string>& rules) {
    auto matcher = IpMatcher::compile(rules);
    EXPECT_TRUE(matcher.has_value());
    return matcher.value_or(IpMatcher{});
}

DomainMatcher domainRules(const std::vector<std::string>& rules) {
    auto matcher = DomainMatcher::compile(rules);
    EXPECT_TRUE(matcher.has_value());
    return matcher.value_or(DomainMatcher{});
}

TEST(IpAddressTest, ParsesBothFamilies) {
    auto v4 = IpAddress::parse("192.168.0.1");
    ASSERT_TRUE(v4.has_value());
    EXPECT_FALSE(v4->v6);
    EXPECT_EQ(v4->bytes[0], 192);

    auto v6 = IpAddress::parse("2001:db8::1");
    ASSERT_TRUE(v6.has_value());
    EXPECT_TRUE(v6->v6);

    EXPECT_FALSE(IpAddress::parse("300.1.1.1").has_value());
    EXPECT_FALSE(IpAddress::parse("not an ip").has_value());
    EXPECT_FALSE(IpAddress::parse("").has_value());
}

TEST(IpMatcherTest, ByteAlignedIpv4BlocksBecomeTextPrefixes) {
    auto matcher = ipRules({"10.0.0.0/8", "192.168.1.0/24"});
    ASSERT_EQ(matcher.rules().size(), 2u);
    EXPECT_EQ(matcher.rules()[0].kind, IpMatcher::RuleKind::kPrefix);
    EXPECT_EQ(matcher.rules()[0].text, "10.");
    EXPECT_EQ(matcher.rules()[1].text, "192.168.1.");

    EXPECT_TRUE(matcher.matches("10.20.30.40"));
    EXPECT_TRUE(matcher.matches("192.168.1.77"));
    EXPECT_FALSE(matcher.matches("192.168.10.1"));
    EXPECT_FALSE(matcher.matches("100.0.0.1"));
}

TEST(IpMatcherTest, ArbitraryCidr) {
    auto matcher = ipRules({"172.16.0.0/12"});
    EXPECT_EQ(matcher.rules()[0].kind, IpMatcher::RuleKind::kCidr);
    EXPECT_TRUE(matcher.matches("172.16.0.1"));
    EXPECT_TRUE(matcher.matches("172.31.255.255"));
    EXPECT_FALSE(matcher.matches("172.32.0.0"));
    EXPECT_FALSE(matcher.matches("garbage"));
}

TEST(IpMatcherTest, Ipv6Cidr) {
    auto matcher = ipRules({"2001:db8::/32"});
    EXPECT_TRUE(matcher.matches("2001:db8:1234::5"));
    EXPECT_FALSE(matcher.matches("2001:db9::1"));
    EXPECT_FALSE(matcher.matches("10.0.0.1"));
}

TEST(IpMatcherTest, RangesAndExactAddresses) {
    auto matcher = ipRules({"10.0.0.5-10.0.0.9", "8.8.8.8"});
    EXPECT_TRUE(matcher.matches("10.0.0.5"));
    EXPECT_TRUE(matcher.matches("10.0.0.9"));
    EXPECT_FALSE(matcher.matches("10.0.0.10"));
    EXPECT_TRUE(matcher.matches("8.8.8.8"));
    EXPECT_FALSE(matcher.matches("8.8.4.4"));
}

TEST(IpMatcherTest, EmptyRuleListMatchesEverything) {
    auto matcher = ipRules({"", "  "});
    EXPECT_TRUE(matcher.rules().empty());
    EXPECT_TRUE(matcher.matches("1.2.3.4"));
}

TEST(IpMatcherTest, RejectsMalformedRules) {
    EXPECT_EQ(IpMatcher::compile({"10.0.0.0/33"}).error().code(), ErrorCode::kConfigError);
    EXPECT_FALSE(IpMatcher::compile({"10.0.0.0/"}).has_value());
    EXPECT_FALSE(IpMatcher::compile({"10.0.0.9-10.0.0.1"}).has_value());
    EXPECT_FALSE(IpMatcher::compile({"10.0.0.1-::1"}).has_value());
    EXPECT_FALSE(IpMatcher::compile({"example.com"}).has_value());
}

TEST(DomainMatcherTest, ExactAndWildcard) {
    auto matcher = domainRules({"api.example.com", "*.internal.net"});

    EXPECT_TRUE(matcher.matches("api.example.com"));
    EXPECT_FALSE(matcher.matches("www.example.com"));
    EXPECT_TRUE(matcher.matches("db.internal.net"));
    EXPECT_TRUE(matcher.matches("a.b.internal.net"));
    EXPECT_TRUE(matcher.matches("internal.net"));
    EXPECT_FALSE(matcher.matches("evilinternal.net"));
}

TEST(DomainMatcherTest, EmptyAndInvalidRules) {
    EXPECT_TRUE(domainRules({}).matches("anything"));
    EXPECT_FALSE(DomainMatcher::compile({"*."}).has_value());
}

}  // namespace
}  // namespace logq::query
