#pragma once

// Records.hpp — persisted records: imported tunnel profiles and device mappings.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SafeRoute
{
    /// First routing table id handed out to a profile.
    constexpr std::uint32_t kTableIdBase = 100;

    /// Prefix of every interface the engine creates.
    constexpr const char *kInterfacePrefix = "sr_";

    /// Kernel limit for interface names (IFNAMSIZ - 1).
    constexpr std::size_t kMaxInterfaceName = 15;

    /// Main-table host route installed for a tunnel's resolved peer.
    struct EndpointPin
    {
        std::string destination;      ///< "198.51.100.7/32"
        std::string gateway;
        std::string interface_name;

        bool operator==(const EndpointPin &o) const
        {
            return destination == o.destination && gateway == o.gateway &&
                   interface_name == o.interface_name;
        }
    };

    /**
     * @brief Imported tunnel profile. Immutable after import apart from the
     *        pin bookkeeping; the private key stays in the managed definition
     *        file and is not part of metadata.
     */
    struct TunnelProfile
    {
        std::string              name;
        std::uint32_t            table_id = 0;
        std::string              interface_name;
        std::string              definition_path;   ///< managed copy of the definition
        std::string              peer_public_key;
        std::string              endpoint_host;
        std::uint16_t            endpoint_port = 0;
        std::vector<std::string> allowed_ips;       ///< CIDR list
        std::string              local_address;     ///< CIDR
        std::vector<std::string> dns_servers;       ///< ordered, possibly empty
        std::optional<EndpointPin> pin;             ///< last pinned endpoint route, if any
    };

    struct DeviceMapping
    {
        std::string                ip;
        std::string                tunnel_name;
        bool                       active = true;
        std::optional<std::string> nickname;
    };

    /**
     * @brief Interface name for a profile: "sr_<name>" when it fits,
     *        otherwise a truncated sanitized name plus a short stable hash.
     */
    std::string DeriveInterfaceName(const std::string &profile_name);
} // namespace SafeRoute
