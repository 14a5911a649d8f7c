#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Kernel/NftFirewall.hpp"

#include <gtest/gtest.h>

using namespace SafeRoute;

namespace
{
    // nft -j -a list chain ip saferoute_dns prerouting
    constexpr const char *kListing = R"({"nftables": [
      {"metainfo": {"version": "1.0.6", "json_schema_version": 1}},
      {"chain": {"family": "ip", "table": "saferoute_dns", "name": "prerouting", "handle": 1,
                 "type": "nat", "hook": "prerouting", "prio": -100, "policy": "accept"}},
      {"rule": {"family": "ip", "table": "saferoute_dns", "chain": "prerouting", "handle": 8,
                "comment": "saferoute:dns",
                "expr": [
                  {"match": {"op": "==", "left": {"payload": {"protocol": "ip", "field": "saddr"}},
                             "right": "192.168.1.50"}},
                  {"match": {"op": "==", "left": {"payload": {"protocol": "tcp", "field": "dport"}},
                             "right": 53}},
                  {"dnat": {"addr": "10.2.0.1", "port": 53}}]}},
      {"rule": {"family": "ip", "table": "saferoute_dns", "chain": "prerouting", "handle": 4,
                "expr": [{"counter": {"packets": 0, "bytes": 0}}]}},
      {"rule": {"family": "ip", "table": "saferoute_dns", "chain": "prerouting", "handle": 7,
                "comment": "saferoute:dns",
                "expr": [
                  {"match": {"op": "==", "left": {"payload": {"protocol": "ip", "field": "saddr"}},
                             "right": "192.168.1.50"}},
                  {"match": {"op": "==", "left": {"meta": {"key": "l4proto"}}, "right": "udp"}},
                  {"match": {"op": "==", "left": {"payload": {"protocol": "udp", "field": "dport"}},
                             "right": 53}},
                  {"dnat": {"addr": "10.2.0.1", "port": 53}}]}}
    ]})";
}

TEST(NftListing, ParsesDnatRulesWithChainPositions)
{
    const auto rules = ParseDnatListing(kListing);
    ASSERT_EQ(rules.size(), 2u);

    EXPECT_EQ(rules[0].position, 1u);
    EXPECT_EQ(rules[0].handle, 8u);
    EXPECT_EQ(rules[0].source, "192.168.1.50");
    EXPECT_EQ(rules[0].protocol, "tcp");
    EXPECT_EQ(rules[0].dport, 53);
    EXPECT_EQ(rules[0].to_address, "10.2.0.1");
    EXPECT_EQ(rules[0].to_port, 53);
    EXPECT_EQ(rules[0].comment, "saferoute:dns");

    // the counter-only rule still occupies position 2
    EXPECT_EQ(rules[1].position, 3u);
    EXPECT_EQ(rules[1].handle, 7u);
    EXPECT_EQ(rules[1].protocol, "udp");
}

TEST(NftListing, EmptyChain)
{
    EXPECT_TRUE(ParseDnatListing(R"({"nftables": [{"metainfo": {}}]})").empty());
}

TEST(NftListing, RejectsMalformedOutput)
{
    EXPECT_THROW(ParseDnatListing("not json"), KernelOperationError);
    EXPECT_THROW(ParseDnatListing(R"({"rules": []})"), KernelOperationError);
}

TEST(NftListing, RuleText)
{
    NatRule r;
    r.source     = "192.168.1.60";
    r.protocol   = "udp";
    r.dport      = 53;
    r.to_address = "10.3.0.1";
    r.to_port    = 53;
    r.comment    = "saferoute:dns";
    EXPECT_EQ(DnatRuleText(r),
              "ip saddr 192.168.1.60 udp dport 53 dnat ip to 10.3.0.1:53 comment \"saferoute:dns\"");
}

TEST(NftListing, RuleTextForIpv6Client)
{
    NatRule r;
    r.source     = "fd00::5";
    r.protocol   = "tcp";
    r.dport      = 53;
    r.to_address = "fd00:2::1";
    r.to_port    = 53;
    EXPECT_EQ(DnatRuleText(r), "ip6 saddr fd00::5 tcp dport 53 dnat ip6 to [fd00:2::1]:53");
}
