#pragma once

// NetlinkControl.hpp — NetworkControl over rtnetlink (libnl-route-3),
// WireGuard generic netlink and /proc/sys.

#include "SafeRoute/Kernel/NetworkControl.hpp"

namespace SafeRoute
{
    class NetlinkControl : public NetworkControl
    {
    public:
        NetlinkControl() = default;

        bool LinkExists(const std::string &ifname) override;
        std::vector<std::string> ListLinks() override;
        Outcome CreateLink(const std::string &ifname, const std::string &kind) override;
        Outcome DeleteLink(const std::string &ifname) override;
        Outcome SetAddress(const std::string &ifname, const std::string &cidr) override;
        Outcome SetMtu(const std::string &ifname, int mtu) override;
        Outcome SetLinkUp(const std::string &ifname) override;

        Outcome ConfigureWireGuard(const std::string &ifname,
                                   const std::string &private_key,
                                   const WireGuardPeer &peer) override;
        std::optional<WireGuardStatus> QueryWireGuard(const std::string &ifname) override;

        std::optional<Gateway> DefaultGateway(int family) override;
        Outcome AddRoute(const RouteSpec &route) override;
        Outcome DeleteRoute(const RouteSpec &route) override;

        std::vector<PolicyRule> ListRules() override;
        Outcome AddRule(const PolicyRule &rule) override;
        Outcome DeleteRule(const PolicyRule &rule) override;

        Outcome WriteSysctl(const std::string &key, const std::string &value) override;
    };
} // namespace SafeRoute
