#include "SafeRoute/Kernel/WireGuard.hpp"
#include "SafeRoute/Kernel/Netlink.hpp"
#include "SafeRoute/Logger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <linux/time_types.h>
#include <linux/wireguard.h>

#include <netlink/netlink.h>
#include <netlink/errno.h>
#include <netlink/attr.h>
#include <netlink/msg.h>

#include <cstring>
#include <exception>
#include <string>

namespace SafeRoute::WireGuard
{
    namespace
    {
        // -------- base64, constant time, WireGuard key layout --------
        void EncodeQuad(char dest[4], const std::uint8_t src[3])
        {
            const std::uint8_t input[] = {
                static_cast<std::uint8_t>((src[0] >> 2) & 63),
                static_cast<std::uint8_t>(((src[0] << 4) | (src[1] >> 4)) & 63),
                static_cast<std::uint8_t>(((src[1] << 2) | (src[2] >> 6)) & 63),
                static_cast<std::uint8_t>(src[2] & 63)};

            for (int i = 0; i < 4; ++i)
            {
                dest[i] = static_cast<char>(input[i] + 'A'
                                            + (((25 - input[i]) >> 8) & 6)
                                            - (((51 - input[i]) >> 8) & 75)
                                            - (((61 - input[i]) >> 8) & 15)
                                            + (((62 - input[i]) >> 8) & 3));
            }
        }

        // < 0 on a character outside the alphabet
        int DecodeQuad(const char src[4])
        {
            int val = 0;
            for (int i = 0; i < 4; ++i)
            {
                const int c = static_cast<unsigned char>(src[i]);
                val |= (-1
                        + (((('A' - 1) - c) & (c - ('Z' + 1))) >> 8 & (c - 64))
                        + (((('a' - 1) - c) & (c - ('z' + 1))) >> 8 & (c - 70))
                        + (((('0' - 1) - c) & (c - ('9' + 1))) >> 8 & (c + 5))
                        + (((('+' - 1) - c) & (c - ('+' + 1))) >> 8 & 63)
                        + (((('/' - 1) - c) & (c - ('/' + 1))) >> 8 & 64))
                       << (18 - 6 * i);
            }
            return val;
        }

        struct Prefix
        {
            int           family = AF_INET;
            in6_addr      addr {};
            std::uint8_t  cidr = 0;
        };

        bool ParsePrefix(const std::string &text, Prefix &out)
        {
            std::string host = text;
            int bits = -1;
            const auto slash = text.find('/');
            if (slash != std::string::npos)
            {
                host = text.substr(0, slash);
                try
                {
                    bits = std::stoi(text.substr(slash + 1));
                }
                catch (const std::exception &)
                {
                    return false;
                }
            }

            out.family = host.find(':') != std::string::npos ? AF_INET6 : AF_INET;
            const int max = out.family == AF_INET ? 32 : 128;
            if (bits < 0) bits = max;
            if (bits > max) return false;
            out.cidr = static_cast<std::uint8_t>(bits);
            return ::inet_pton(out.family, host.c_str(), &out.addr) == 1;
        }

        std::string EndpointToString(const sockaddr *sa)
        {
            char buf[INET6_ADDRSTRLEN] = {};
            if (sa->sa_family == AF_INET)
            {
                const auto *in = reinterpret_cast<const sockaddr_in *>(sa);
                ::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
                return std::string(buf) + ":" + std::to_string(ntohs(in->sin_port));
            }
            if (sa->sa_family == AF_INET6)
            {
                const auto *in6 = reinterpret_cast<const sockaddr_in6 *>(sa);
                ::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
                return "[" + std::string(buf) + "]:" + std::to_string(ntohs(in6->sin6_port));
            }
            return {};
        }

        int ResolveFamily(nl_sock *sk)
        {
            return Netlink::GenlResolveFamily(sk, WG_GENL_NAME);
        }

        // -------- WG_CMD_GET_DEVICE reply --------
        int OnDeviceMessage(nl_msg *msg, void *arg)
        {
            auto *status = static_cast<WireGuardStatus *>(arg);

            nlattr *attrs[WGDEVICE_A_MAX + 1] = {};
            if (Netlink::GenlParse(nlmsg_hdr(msg), attrs, WGDEVICE_A_MAX) < 0)
            {
                return NL_SKIP;
            }

            if (attrs[WGDEVICE_A_LISTEN_PORT])
            {
                status->listen_port = nla_get_u16(attrs[WGDEVICE_A_LISTEN_PORT]);
            }
            if (!attrs[WGDEVICE_A_PEERS]) return NL_OK;

            nlattr *peer = nullptr;
            int rem = 0;
            nla_for_each_nested(peer, attrs[WGDEVICE_A_PEERS], rem)
            {
                // единственный пир; продолжения дампа повторяют тот же ключ
                nlattr *p[WGPEER_A_MAX + 1] = {};
                if (nla_parse_nested(p, WGPEER_A_MAX, peer, nullptr) < 0) continue;

                if (p[WGPEER_A_PUBLIC_KEY] && nla_len(p[WGPEER_A_PUBLIC_KEY]) == WG_KEY_LEN)
                {
                    Key k {};
                    std::memcpy(k.data(), nla_data(p[WGPEER_A_PUBLIC_KEY]), WG_KEY_LEN);
                    const std::string key = EncodeKey(k);
                    if (!status->peer_public_key.empty() && status->peer_public_key != key) continue;
                    status->peer_public_key = key;
                }
                if (p[WGPEER_A_ENDPOINT] &&
                    nla_len(p[WGPEER_A_ENDPOINT]) >= static_cast<int>(sizeof(sockaddr)))
                {
                    status->peer_endpoint =
                        EndpointToString(static_cast<const sockaddr *>(nla_data(p[WGPEER_A_ENDPOINT])));
                }
                if (p[WGPEER_A_LAST_HANDSHAKE_TIME] &&
                    nla_len(p[WGPEER_A_LAST_HANDSHAKE_TIME]) == static_cast<int>(sizeof(__kernel_timespec)))
                {
                    __kernel_timespec ts {};
                    std::memcpy(&ts, nla_data(p[WGPEER_A_LAST_HANDSHAKE_TIME]), sizeof(ts));
                    status->last_handshake_unix = ts.tv_sec;
                }
                if (p[WGPEER_A_RX_BYTES]) status->rx_bytes = nla_get_u64(p[WGPEER_A_RX_BYTES]);
                if (p[WGPEER_A_TX_BYTES]) status->tx_bytes = nla_get_u64(p[WGPEER_A_TX_BYTES]);
            }
            return NL_OK;
        }
    } // namespace

    std::optional<Key> DecodeKey(const std::string &b64)
    {
        if (b64.size() != kKeyB64Len || b64[kKeyB64Len - 1] != '=') return std::nullopt;

        Key key {};
        unsigned ret = 0;
        for (std::size_t i = 0; i < kKeyLen / 3; ++i)
        {
            const int val = DecodeQuad(&b64[i * 4]);
            ret |= static_cast<unsigned>(val) >> 31;
            key[i * 3 + 0] = static_cast<std::uint8_t>((val >> 16) & 0xff);
            key[i * 3 + 1] = static_cast<std::uint8_t>((val >> 8) & 0xff);
            key[i * 3 + 2] = static_cast<std::uint8_t>(val & 0xff);
        }

        const char tail[4] = {b64[40], b64[41], b64[42], 'A'};
        const int val = DecodeQuad(tail);
        ret |= (static_cast<unsigned>(val) >> 31) | static_cast<unsigned>(val & 0xff);
        key[30] = static_cast<std::uint8_t>((val >> 16) & 0xff);
        key[31] = static_cast<std::uint8_t>((val >> 8) & 0xff);

        if (ret != 0) return std::nullopt;
        return key;
    }

    std::string EncodeKey(const Key &key)
    {
        std::string out(kKeyB64Len, '\0');
        for (std::size_t i = 0; i < kKeyLen / 3; ++i)
        {
            EncodeQuad(&out[i * 4], &key[i * 3]);
        }
        const std::uint8_t tail[3] = {key[30], key[31], 0};
        EncodeQuad(&out[40], tail);
        out[kKeyB64Len - 1] = '=';
        return out;
    }

    Outcome SetDevice(const std::string   &ifname,
                      const std::string   &private_key_b64,
                      const WireGuardPeer &peer)
    {
        const auto priv = DecodeKey(private_key_b64);
        if (!priv) return Outcome::Failed("invalid private key");
        const auto pub = DecodeKey(peer.public_key);
        if (!pub) return Outcome::Failed("invalid peer public key");

        sockaddr_storage ep {};
        socklen_t ep_len = 0;
        if (peer.endpoint_address.find(':') != std::string::npos)
        {
            auto *in6 = reinterpret_cast<sockaddr_in6 *>(&ep);
            in6->sin6_family = AF_INET6;
            in6->sin6_port   = htons(peer.endpoint_port);
            if (::inet_pton(AF_INET6, peer.endpoint_address.c_str(), &in6->sin6_addr) != 1)
            {
                return Outcome::Failed("bad endpoint address " + peer.endpoint_address);
            }
            ep_len = sizeof(sockaddr_in6);
        }
        else
        {
            auto *in = reinterpret_cast<sockaddr_in *>(&ep);
            in->sin_family = AF_INET;
            in->sin_port   = htons(peer.endpoint_port);
            if (::inet_pton(AF_INET, peer.endpoint_address.c_str(), &in->sin_addr) != 1)
            {
                return Outcome::Failed("bad endpoint address " + peer.endpoint_address);
            }
            ep_len = sizeof(sockaddr_in);
        }

        Netlink::NlSock s(NETLINK_GENERIC);
        const int family = ResolveFamily(s.sk);
        if (family < 0)
        {
            LOGE("wireguard") << "genl family " << WG_GENL_NAME << " unavailable: " << nl_geterror(family);
            return Outcome::Failed(std::string("wireguard genl: ") + nl_geterror(family));
        }

        nl_msg *msg = nlmsg_alloc();
        if (!msg) return Outcome::Failed("nlmsg_alloc failed");

        bool ok = Netlink::GenlPut(msg, family, NLM_F_REQUEST | NLM_F_ACK, WG_CMD_SET_DEVICE, WG_GENL_VERSION);
        ok = ok && nla_put_string(msg, WGDEVICE_A_IFNAME, ifname.c_str()) == 0;
        ok = ok && nla_put(msg, WGDEVICE_A_PRIVATE_KEY, WG_KEY_LEN, priv->data()) == 0;
        ok = ok && nla_put_u32(msg, WGDEVICE_A_FLAGS, WGDEVICE_F_REPLACE_PEERS) == 0;

        nlattr *peers = ok ? nla_nest_start(msg, WGDEVICE_A_PEERS | NLA_F_NESTED) : nullptr;
        nlattr *entry = peers ? nla_nest_start(msg, 0 | NLA_F_NESTED) : nullptr;
        ok = entry != nullptr;
        ok = ok && nla_put(msg, WGPEER_A_PUBLIC_KEY, WG_KEY_LEN, pub->data()) == 0;
        ok = ok && nla_put_u32(msg, WGPEER_A_FLAGS, WGPEER_F_REPLACE_ALLOWEDIPS) == 0;
        ok = ok && nla_put(msg, WGPEER_A_ENDPOINT, static_cast<int>(ep_len), &ep) == 0;
        ok = ok && nla_put_u16(msg, WGPEER_A_PERSISTENT_KEEPALIVE_INTERVAL, peer.keepalive_seconds) == 0;

        nlattr *aips = ok ? nla_nest_start(msg, WGPEER_A_ALLOWEDIPS | NLA_F_NESTED) : nullptr;
        ok = aips != nullptr;
        for (const auto &cidr : peer.allowed_ips)
        {
            if (!ok) break;
            Prefix p;
            if (!ParsePrefix(cidr, p))
            {
                nlmsg_free(msg);
                return Outcome::Failed("bad allowed IP " + cidr);
            }
            nlattr *a = nla_nest_start(msg, 0 | NLA_F_NESTED);
            ok = a != nullptr;
            ok = ok && nla_put_u16(msg, WGALLOWEDIP_A_FAMILY, static_cast<std::uint16_t>(p.family)) == 0;
            ok = ok && nla_put(msg, WGALLOWEDIP_A_IPADDR,
                               p.family == AF_INET ? 4 : 16, &p.addr) == 0;
            ok = ok && nla_put_u8(msg, WGALLOWEDIP_A_CIDR_MASK, p.cidr) == 0;
            if (ok) nla_nest_end(msg, a);
        }
        if (ok)
        {
            nla_nest_end(msg, aips);
            nla_nest_end(msg, entry);
            nla_nest_end(msg, peers);
        }
        if (!ok)
        {
            nlmsg_free(msg);
            return Outcome::Failed("WG_CMD_SET_DEVICE message too large");
        }

        // nl_send_sync frees msg and waits for the ACK
        const int err = nl_send_sync(s.sk, msg);
        if (err < 0)
        {
            LOGE("wireguard") << "SetDevice " << ifname << ": " << nl_geterror(err);
            return Outcome::Failed(std::string("WG_CMD_SET_DEVICE: ") + nl_geterror(err));
        }

        LOGI("wireguard") << "Configured " << ifname << " peer " << peer.endpoint_address
                          << ":" << peer.endpoint_port << " allowed=" << peer.allowed_ips.size();
        return Outcome::Applied();
    }

    std::optional<WireGuardStatus> GetDevice(const std::string &ifname)
    {
        Netlink::NlSock s(NETLINK_GENERIC);
        const int family = ResolveFamily(s.sk);
        if (family < 0)
        {
            LOGW("wireguard") << "genl family " << WG_GENL_NAME << " unavailable: " << nl_geterror(family);
            return std::nullopt;
        }

        nl_msg *msg = nlmsg_alloc();
        if (!msg) return std::nullopt;
        if (!Netlink::GenlPut(msg, family, NLM_F_REQUEST | NLM_F_DUMP, WG_CMD_GET_DEVICE, WG_GENL_VERSION) ||
            nla_put_string(msg, WGDEVICE_A_IFNAME, ifname.c_str()) < 0)
        {
            nlmsg_free(msg);
            return std::nullopt;
        }

        WireGuardStatus status;
        nl_socket_modify_cb(s.sk, NL_CB_VALID, NL_CB_CUSTOM, &OnDeviceMessage, &status);

        int err = nl_send_auto(s.sk, msg);
        nlmsg_free(msg);
        if (err >= 0)
        {
            err = nl_recvmsgs_default(s.sk);
        }
        if (err < 0)
        {
            LOGD("wireguard") << "GetDevice " << ifname << ": " << nl_geterror(err);
            return std::nullopt;
        }
        return status;
    }
} // namespace SafeRoute::WireGuard
