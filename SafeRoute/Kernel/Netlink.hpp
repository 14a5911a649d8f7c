#pragma once

// Netlink.hpp — RAII-обёртки над объектами libnl.

#include <netlink/netlink.h>
#include <netlink/addr.h>
#include <netlink/msg.h>

#include <cstdint>
#include <string>

namespace SafeRoute::Netlink
{
    /// Connected libnl socket; throws KernelOperationError when the kernel refuses.
    struct NlSock
    {
        nl_sock *sk {nullptr};

        explicit NlSock(int protocol = NETLINK_ROUTE);
        ~NlSock();

        NlSock(const NlSock&) = delete;
        NlSock& operator=(const NlSock&) = delete;
    };

    /// Owned nl_addr.
    struct NlAddr
    {
        nl_addr *addr {nullptr};

        NlAddr() = default;
        ~NlAddr() { if (addr) nl_addr_put(addr); }

        NlAddr(const NlAddr&) = delete;
        NlAddr& operator=(const NlAddr&) = delete;

        /// "10.0.0.1", "10.0.0.0/24", "fd00::1/64". Returns NLE error (<0) or 0.
        int Parse(const std::string &text, int family);
    };

    /// nl_addr2str without the prefix for host addresses.
    std::string AddrToString(nl_addr *a);

    /// "10.0.0.1/32" => AF_INET, ":" => AF_INET6.
    int FamilyOf(const std::string &address);

    // ---- generic netlink framing on plain libnl-3 ----

    /// nlmsghdr + genlmsghdr for cmd/version addressed to family.
    bool GenlPut(nl_msg *msg, int family, int flags, std::uint8_t cmd, std::uint8_t version);

    /// Attributes following the genl header.
    int GenlParse(nlmsghdr *nlh, nlattr **attrs, int max_type);

    /// CTRL_CMD_GETFAMILY: numeric id of a genl family, or an NLE error (<0).
    int GenlResolveFamily(nl_sock *sk, const char *name);
} // namespace SafeRoute::Netlink
