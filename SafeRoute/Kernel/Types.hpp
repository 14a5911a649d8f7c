#pragma once

// Types.hpp — value types exchanged with the kernel capability.

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace SafeRoute
{
    /// Result of an idempotent kernel mutation.
    enum class OpResult
    {
        Applied,    ///< state changed (object created / removed)
        Unchanged,  ///< already in the desired state (EEXIST / ENOENT)
        Failed
    };

    const char *ToString(OpResult r) noexcept;

    struct Outcome
    {
        OpResult    result = OpResult::Applied;
        std::string detail;

        static Outcome Applied()                       { return { OpResult::Applied, {} }; }
        static Outcome Unchanged(std::string why = {}) { return { OpResult::Unchanged, std::move(why) }; }
        static Outcome Failed(std::string why)         { return { OpResult::Failed, std::move(why) }; }

        bool Ok() const noexcept { return result != OpResult::Failed; }
    };

    /// Main routing table (RT_TABLE_MAIN).
    constexpr std::uint32_t kMainTable = 254;

    struct RouteSpec
    {
        std::string   destination;      ///< CIDR, "0.0.0.0/0" for default
        std::uint32_t table = kMainTable;
        std::string   gateway;          ///< empty: on-link via interface
        std::string   interface_name;
    };

    /// Policy rule: "from <source> lookup <table> pref <priority>".
    struct PolicyRule
    {
        std::string   source;           ///< CIDR; host addresses carry /32 (/128)
        std::uint32_t table    = 0;
        std::uint32_t priority = 0;

        bool operator==(const PolicyRule &o) const
        {
            return source == o.source && table == o.table && priority == o.priority;
        }
    };

    /// Default route of the main table.
    struct Gateway
    {
        std::string address;
        std::string interface_name;
        int         ifindex = 0;
    };

    struct WireGuardPeer
    {
        std::string              public_key;        ///< base64
        std::string              endpoint_address;  ///< resolved literal
        std::uint16_t            endpoint_port = 0;
        std::vector<std::string> allowed_ips;
        std::uint16_t            keepalive_seconds = 25;
    };

    struct WireGuardStatus
    {
        std::uint16_t listen_port = 0;
        std::string   peer_public_key;
        std::string   peer_endpoint;
        std::int64_t  last_handshake_unix = 0;  ///< 0: never
        std::uint64_t rx_bytes = 0;
        std::uint64_t tx_bytes = 0;
    };

    /// One DNAT rule in a NAT chain as listed by the firewall.
    struct NatRule
    {
        std::size_t   position = 0;     ///< 1-based, listing order
        std::uint64_t handle   = 0;     ///< firewall handle, 0 if unknown
        std::string   source;           ///< "192.168.1.50" (no /32)
        std::string   protocol;         ///< "udp" | "tcp"
        std::uint16_t dport    = 0;
        std::string   to_address;       ///< DNAT target
        std::uint16_t to_port  = 0;
        std::string   comment;
    };

    /// Strip a host prefix ("/32", "/128") from an address.
    std::string HostOf(const std::string &cidr);

    /// Add the host prefix if missing.
    std::string AsHostCidr(const std::string &address);
} // namespace SafeRoute
