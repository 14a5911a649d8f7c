#include "SafeRoute/Kernel/Netlink.hpp"

#include <netlink/attr.h>
#include <netlink/errno.h>

#include <linux/genetlink.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "SafeRoute/Errors.hpp"

#include <stdexcept>

namespace SafeRoute::Netlink
{
    NlSock::NlSock(int protocol)
    {
        sk = nl_socket_alloc();
        if (!sk)
        {
            throw KernelOperationError("nl_socket_alloc failed");
        }
        int err = nl_connect(sk, protocol);
        if (err < 0)
        {
            std::string msg = std::string("nl_connect: ") + nl_geterror(err);
            nl_socket_free(sk);
            sk = nullptr;
            throw KernelOperationError(msg);
        }
    }

    NlSock::~NlSock()
    {
        if (sk) nl_socket_free(sk);
    }

    int NlAddr::Parse(const std::string &text, int family)
    {
        if (addr)
        {
            nl_addr_put(addr);
            addr = nullptr;
        }
        return nl_addr_parse(text.c_str(), family, &addr);
    }

    std::string AddrToString(nl_addr *a)
    {
        if (!a) return {};
        char buf[INET6_ADDRSTRLEN + 8] = {};
        nl_addr2str(a, buf, sizeof(buf));
        return buf;
    }

    int FamilyOf(const std::string &address)
    {
        return address.find(':') != std::string::npos ? AF_INET6 : AF_INET;
    }

    bool GenlPut(nl_msg *msg, int family, int flags, std::uint8_t cmd, std::uint8_t version)
    {
        nlmsghdr *nlh = nlmsg_put(msg, NL_AUTO_PORT, NL_AUTO_SEQ, family, GENL_HDRLEN, flags);
        if (!nlh) return false;

        auto *g = static_cast<genlmsghdr *>(nlmsg_data(nlh));
        g->cmd      = cmd;
        g->version  = version;
        g->reserved = 0;
        return true;
    }

    int GenlParse(nlmsghdr *nlh, nlattr **attrs, int max_type)
    {
        return nlmsg_parse(nlh, GENL_HDRLEN, attrs, max_type, nullptr);
    }

    namespace
    {
        int OnFamilyReply(nl_msg *msg, void *arg)
        {
            nlattr *attrs[CTRL_ATTR_MAX + 1] = {};
            if (GenlParse(nlmsg_hdr(msg), attrs, CTRL_ATTR_MAX) < 0 || !attrs[CTRL_ATTR_FAMILY_ID])
            {
                return NL_SKIP;
            }
            *static_cast<int *>(arg) = nla_get_u16(attrs[CTRL_ATTR_FAMILY_ID]);
            return NL_STOP;
        }
    } // namespace

    int GenlResolveFamily(nl_sock *sk, const char *name)
    {
        nl_msg *msg = nlmsg_alloc();
        if (!msg) return -NLE_NOMEM;

        if (!GenlPut(msg, GENL_ID_CTRL, NLM_F_REQUEST, CTRL_CMD_GETFAMILY, 1) ||
            nla_put_string(msg, CTRL_ATTR_FAMILY_NAME, name) < 0)
        {
            nlmsg_free(msg);
            return -NLE_MSGSIZE;
        }

        int family = -NLE_OBJ_NOTFOUND;
        nl_socket_modify_cb(sk, NL_CB_VALID, NL_CB_CUSTOM, &OnFamilyReply, &family);

        int err = nl_send_auto(sk, msg);
        nlmsg_free(msg);
        if (err < 0) return err;

        err = nl_recvmsgs_default(sk);
        // &family не переживёт этот вызов
        nl_socket_modify_cb(sk, NL_CB_VALID, NL_CB_DEFAULT, nullptr, nullptr);
        if (err < 0) return err;
        return family;
    }
} // namespace SafeRoute::Netlink
