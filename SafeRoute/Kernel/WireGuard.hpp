#pragma once

// WireGuard.hpp — WireGuard device configuration over generic netlink
// (family "wireguard") and key text helpers.

#include "SafeRoute/Kernel/Types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace SafeRoute::WireGuard
{
    constexpr std::size_t kKeyLen    = 32;
    constexpr std::size_t kKeyB64Len = 44;

    using Key = std::array<std::uint8_t, kKeyLen>;

    /// Standard 44-char base64 key => 32 bytes; nullopt on any malformed input.
    std::optional<Key> DecodeKey(const std::string &b64);

    std::string EncodeKey(const Key &key);

    /**
     * @brief WG_CMD_SET_DEVICE: private key, replace all peers with `peer`,
     *        replace its allowed IPs, persistent keepalive.
     */
    Outcome SetDevice(const std::string   &ifname,
                      const std::string   &private_key_b64,
                      const WireGuardPeer &peer);

    /// WG_CMD_GET_DEVICE (dump); first peer only. nullopt if not a WireGuard link.
    std::optional<WireGuardStatus> GetDevice(const std::string &ifname);
} // namespace SafeRoute::WireGuard
