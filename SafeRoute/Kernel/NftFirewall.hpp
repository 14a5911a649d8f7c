#pragma once

// NftFirewall.hpp — NatFirewall on nftables (libnftables).
//
//   table inet saferoute_dns   — prerouting DNAT of client DNS queries (v4 and v6)
//   table inet saferoute_nat   — masquerade / MSS clamp / forward for sr_* links

#include "SafeRoute/Kernel/NatFirewall.hpp"

#include <string>
#include <vector>

namespace SafeRoute
{
    class NftFirewall : public NatFirewall
    {
    public:
        struct Params
        {
            std::string dns_family  = "inet";
            std::string dns_table   = "saferoute_dns";
            std::string dns_chain   = "prerouting";
            std::string nat_table   = "saferoute_nat";
            int         dnat_priority = -100;   // dstnat
            int         tunnel_mtu    = 1280;   // fixed MSS fallback base
        };

        NftFirewall();
        explicit NftFirewall(const Params &params);

        Outcome EnsureDnatChain() override;
        std::vector<NatRule> ListDnatRules() override;
        Outcome InsertDnatRule(const NatRule &rule) override;
        Outcome DeleteDnatRule(const NatRule &rule) override;
        Outcome EnsureForwarding(const std::string &interface_prefix) override;

    private:
        bool Run_(const std::string &script);

        Params p_;
    };

    /**
     * @brief Parse `nft -j list chain` output into DNAT rules.
     *        Positions count every rule of the chain in listing order; only
     *        rules carrying a dnat statement are returned.
     * @throws KernelOperationError on malformed JSON.
     */
    std::vector<NatRule> ParseDnatListing(const std::string &json);

    /// nftables statement text for a DNAT rule (without table/chain); the
    /// address family follows the rule source.
    std::string DnatRuleText(const NatRule &rule);
} // namespace SafeRoute
