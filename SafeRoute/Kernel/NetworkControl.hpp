#pragma once

// NetworkControl.hpp — kernel network-control surface consumed by the engine.
// Mutations are idempotent and report OpResult; they do not throw for kernel
// rejections. Callers decide what is fatal.

#include "SafeRoute/Kernel/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace SafeRoute
{
    class NetworkControl
    {
    public:
        virtual ~NetworkControl() = default;

        // ---- links ----
        virtual bool LinkExists(const std::string &ifname) = 0;
        virtual std::vector<std::string> ListLinks() = 0;
        virtual Outcome CreateLink(const std::string &ifname, const std::string &kind) = 0;
        /// Absent link => Unchanged.
        virtual Outcome DeleteLink(const std::string &ifname) = 0;
        virtual Outcome SetAddress(const std::string &ifname, const std::string &cidr) = 0;
        virtual Outcome SetMtu(const std::string &ifname, int mtu) = 0;
        virtual Outcome SetLinkUp(const std::string &ifname) = 0;

        // ---- WireGuard ----
        /// Private key plus exactly one peer; replaces any previous peers and allowed IPs.
        virtual Outcome ConfigureWireGuard(const std::string &ifname,
                                           const std::string &private_key,
                                           const WireGuardPeer &peer) = 0;
        virtual std::optional<WireGuardStatus> QueryWireGuard(const std::string &ifname) = 0;

        // ---- routes ----
        /// Default route of the main table for AF_INET / AF_INET6.
        virtual std::optional<Gateway> DefaultGateway(int family) = 0;
        /// Existing identical route => Unchanged.
        virtual Outcome AddRoute(const RouteSpec &route) = 0;
        virtual Outcome DeleteRoute(const RouteSpec &route) = 0;

        // ---- policy rules ----
        virtual std::vector<PolicyRule> ListRules() = 0;
        /// Existing identical rule => Unchanged.
        virtual Outcome AddRule(const PolicyRule &rule) = 0;
        /// Removes one rule matching source/table/priority; none => Unchanged.
        virtual Outcome DeleteRule(const PolicyRule &rule) = 0;

        // ---- sysctl ----
        /// dotted key, e.g. "net.ipv4.ip_forward".
        virtual Outcome WriteSysctl(const std::string &key, const std::string &value) = 0;
    };
} // namespace SafeRoute
