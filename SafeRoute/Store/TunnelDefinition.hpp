#pragma once

// TunnelDefinition.hpp — WireGuard-style definition record:
//   [Interface] PrivateKey, Address, DNS
//   [Peer]      PublicKey, Endpoint, AllowedIPs
// Only the first [Peer] section is used.

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace SafeRoute
{
    struct TunnelDefinition
    {
        std::string              private_key;
        std::string              local_address;     ///< first Address entry, always with a prefix
        std::vector<std::string> dns_servers;
        std::string              peer_public_key;
        std::string              endpoint;          ///< as written, "host:port"
        std::string              endpoint_host;
        std::uint16_t            endpoint_port = 0;
        std::vector<std::string> allowed_ips;

        /// Raw key/value pairs, keys lower-cased.
        std::map<std::string, std::string> interface_section;
        std::map<std::string, std::string> peer_section;
    };

    /**
     * @brief Parse a definition from text.
     * @param origin Used in error messages (file name).
     * @throws ConfigInvalid if [Interface] or [Peer] is missing, a line is
     *         malformed, or a required key is absent/invalid.
     */
    TunnelDefinition ParseTunnelDefinition(std::string_view text, const std::string &origin);

    /// Read and parse a file; unreadable file => ConfigInvalid.
    TunnelDefinition LoadTunnelDefinition(const std::string &path);

    /// "host:port" or "[v6]:port" -> {host, port}; throws ConfigInvalid.
    std::pair<std::string, std::uint16_t> SplitEndpoint(const std::string &endpoint);

    /// Comma-separated list, trimmed, empty items dropped.
    std::vector<std::string> SplitList(std::string_view value);
} // namespace SafeRoute
