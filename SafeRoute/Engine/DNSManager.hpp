#pragma once

// DNSManager.hpp — per-client DNS redirect (UDP/TCP 53 -> tunnel resolver).
// The live firewall listing is the source of truth; the tracked map only
// records what this process installed.

#include "SafeRoute/Kernel/NatFirewall.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace SafeRoute
{
    struct DnsAssignment
    {
        std::vector<std::string> dns_servers;
        std::string              primary;
        std::uint32_t            table_id = 0;
    };

    class DNSManager
    {
    public:
        static constexpr std::uint16_t kDnsPort     = 53;
        static constexpr const char   *kRuleComment = "saferoute:dns";

        explicit DNSManager(NatFirewall &fw);

        /**
         * @brief Replace the redirect pair of ip with one to the first server
         *        of ip's address family (dns_servers[0] when families agree).
         *        Empty dns_servers: warning, nothing changes. No server of
         *        that family: warning, old redirects of ip are removed.
         * @throws KernelOperationError; partial rules are removed first.
         */
        void SetupForClient(const std::string              &ip,
                            const std::vector<std::string> &dns_servers,
                            std::uint32_t                   table_id);

        /**
         * @brief Delete every port-53 redirect sourced from ip, highest
         *        position first. Returns the number removed.
         * @throws KernelOperationError if the chain cannot be listed.
         */
        std::size_t CleanupForClient(const std::string &ip);

        /// Live redirect rules for ip.
        std::vector<NatRule> GetForClient(const std::string &ip);

        /// Live redirect rules grouped by client ip.
        std::map<std::string, std::vector<NatRule>> GetAll();

        const std::map<std::string, DnsAssignment> &Tracked() const { return tracked_; }

    private:
        NatFirewall                          &fw_;
        std::map<std::string, DnsAssignment>  tracked_;
    };
} // namespace SafeRoute
