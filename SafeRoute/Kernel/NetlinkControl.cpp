#include "SafeRoute/Kernel/NetlinkControl.hpp"
#include "SafeRoute/Kernel/Netlink.hpp"
#include "SafeRoute/Kernel/WireGuard.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <net/if.h>
#include <unistd.h>

#include <linux/fib_rules.h>

#include <netlink/netlink.h>
#include <netlink/errno.h>
#include <netlink/cache.h>
#include <netlink/route/addr.h>
#include <netlink/route/link.h>
#include <netlink/route/route.h>
#include <netlink/route/nexthop.h>
#include <netlink/route/rule.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace SafeRoute
{
    namespace
    {
        using Netlink::NlAddr;
        using Netlink::NlSock;

        std::string NlError(const char *what, int err)
        {
            return std::string(what) + ": " + nl_geterror(err);
        }

        int IfIndex(const std::string &ifname)
        {
            return static_cast<int>(::if_nametoindex(ifname.c_str()));
        }

        // -------- route message --------
        struct RouteMsg
        {
            rtnl_route *route {nullptr};
            NlAddr      dst;
            NlAddr      gw;

            RouteMsg() : route(rtnl_route_alloc()) {}
            ~RouteMsg() { if (route) rtnl_route_put(route); }

            RouteMsg(const RouteMsg&) = delete;
            RouteMsg& operator=(const RouteMsg&) = delete;
        };

        /// Fills msg from spec; returns an error text or empty.
        std::string BuildRoute(RouteMsg &msg, const RouteSpec &spec)
        {
            if (!msg.route) return "rtnl_route_alloc failed";

            const int family = Netlink::FamilyOf(spec.destination);
            const std::string dst = spec.destination == "default"
                                  ? (family == AF_INET ? "0.0.0.0/0" : "::/0")
                                  : spec.destination;

            int err = msg.dst.Parse(dst, family);
            if (err < 0) return NlError("nl_addr_parse(dst)", err);

            rtnl_route_set_family(msg.route, family);
            rtnl_route_set_table(msg.route, spec.table);
            rtnl_route_set_dst(msg.route, msg.dst.addr);
            rtnl_route_set_type(msg.route, RTN_UNICAST);
            rtnl_route_set_protocol(msg.route, RTPROT_STATIC);

            rtnl_nexthop *nh = rtnl_route_nh_alloc();
            if (!nh) return "rtnl_route_nh_alloc failed";

            if (!spec.interface_name.empty())
            {
                const int ifindex = IfIndex(spec.interface_name);
                if (ifindex == 0)
                {
                    rtnl_route_nh_free(nh);
                    return "no such interface: " + spec.interface_name;
                }
                rtnl_route_nh_set_ifindex(nh, ifindex);
            }

            if (!spec.gateway.empty())
            {
                err = msg.gw.Parse(spec.gateway, family);
                if (err < 0)
                {
                    rtnl_route_nh_free(nh);
                    return NlError("nl_addr_parse(gw)", err);
                }
                rtnl_route_nh_set_gateway(nh, msg.gw.addr);
                rtnl_route_set_scope(msg.route, RT_SCOPE_UNIVERSE);
            }
            else
            {
                rtnl_route_set_scope(msg.route, RT_SCOPE_LINK);
            }

            rtnl_route_add_nexthop(msg.route, nh);
            return {};
        }

        // -------- rule message --------
        struct RuleMsg
        {
            rtnl_rule *rule {nullptr};
            NlAddr     src;

            RuleMsg() : rule(rtnl_rule_alloc()) {}
            ~RuleMsg() { if (rule) rtnl_rule_put(rule); }

            RuleMsg(const RuleMsg&) = delete;
            RuleMsg& operator=(const RuleMsg&) = delete;
        };

        std::string BuildRule(RuleMsg &msg, const PolicyRule &r)
        {
            if (!msg.rule) return "rtnl_rule_alloc failed";

            const int family = Netlink::FamilyOf(r.source);
            int err = msg.src.Parse(AsHostCidr(r.source), family);
            if (err < 0) return NlError("nl_addr_parse(src)", err);

            rtnl_rule_set_family(msg.rule, family);
            rtnl_rule_set_src(msg.rule, msg.src.addr);
            if (r.table != 0)
            {
                rtnl_rule_set_table(msg.rule, r.table);
            }
            rtnl_rule_set_prio(msg.rule, r.priority);
            rtnl_rule_set_action(msg.rule, FR_ACT_TO_TBL);
            return {};
        }

        // -------- link change --------
        Outcome ChangeLink(const std::string &ifname,
                           const char       *what,
                           void            (*apply)(rtnl_link *, int),
                           int               arg)
        {
            const int ifindex = IfIndex(ifname);
            if (ifindex == 0) return Outcome::Failed("no such interface: " + ifname);

            NlSock s;
            rtnl_link *orig = nullptr;
            int err = rtnl_link_get_kernel(s.sk, ifindex, nullptr, &orig);
            if (err < 0) return Outcome::Failed(NlError("rtnl_link_get_kernel", err));

            rtnl_link *change = rtnl_link_alloc();
            if (!change)
            {
                rtnl_link_put(orig);
                return Outcome::Failed("rtnl_link_alloc failed");
            }
            apply(change, arg);

            err = rtnl_link_change(s.sk, orig, change, 0);
            rtnl_link_put(change);
            rtnl_link_put(orig);
            if (err < 0)
            {
                LOGE("netlink") << what << ": rtnl_link_change " << ifname << " rc=" << err;
                return Outcome::Failed(NlError("rtnl_link_change", err));
            }
            LOGD("netlink") << what << ": ok " << ifname;
            return Outcome::Applied();
        }
    } // namespace

    // ---------------------------------------------------------------- links

    bool NetlinkControl::LinkExists(const std::string &ifname)
    {
        return IfIndex(ifname) != 0;
    }

    std::vector<std::string> NetlinkControl::ListLinks()
    {
        NlSock s;
        nl_cache *cache = nullptr;
        int err = rtnl_link_alloc_cache(s.sk, AF_UNSPEC, &cache);
        if (err < 0)
        {
            throw KernelOperationError(NlError("rtnl_link_alloc_cache", err));
        }

        std::vector<std::string> names;
        for (nl_object *o = nl_cache_get_first(cache); o; o = nl_cache_get_next(o))
        {
            const char *name = rtnl_link_get_name(reinterpret_cast<rtnl_link *>(o));
            if (name) names.emplace_back(name);
        }
        nl_cache_free(cache);
        return names;
    }

    Outcome NetlinkControl::CreateLink(const std::string &ifname, const std::string &kind)
    {
        LOGD("netlink") << "CreateLink: " << ifname << " type=" << kind;
        NlSock s;
        rtnl_link *link = rtnl_link_alloc();
        if (!link) return Outcome::Failed("rtnl_link_alloc failed");

        rtnl_link_set_name(link, ifname.c_str());
        int err = rtnl_link_set_type(link, kind.c_str());
        if (err < 0)
        {
            rtnl_link_put(link);
            return Outcome::Failed(NlError("rtnl_link_set_type", err));
        }

        err = rtnl_link_add(s.sk, link, NLM_F_CREATE | NLM_F_EXCL);
        rtnl_link_put(link);

        if (err == -NLE_EXIST)
        {
            LOGD("netlink") << "CreateLink: " << ifname << " already exists";
            return Outcome::Unchanged("link exists");
        }
        if (err < 0)
        {
            LOGE("netlink") << "CreateLink: " << ifname << " rc=" << err << " " << nl_geterror(err);
            return Outcome::Failed(NlError("rtnl_link_add", err));
        }
        LOGI("netlink") << "Link created: " << ifname;
        return Outcome::Applied();
    }

    Outcome NetlinkControl::DeleteLink(const std::string &ifname)
    {
        if (!LinkExists(ifname)) return Outcome::Unchanged("link absent");

        NlSock s;
        rtnl_link *link = rtnl_link_alloc();
        if (!link) return Outcome::Failed("rtnl_link_alloc failed");
        rtnl_link_set_name(link, ifname.c_str());

        const int err = rtnl_link_delete(s.sk, link);
        rtnl_link_put(link);

        if (err == -NLE_OBJ_NOTFOUND || err == -NLE_NODEV)
        {
            return Outcome::Unchanged("link absent");
        }
        if (err < 0)
        {
            LOGE("netlink") << "DeleteLink: " << ifname << " rc=" << err;
            return Outcome::Failed(NlError("rtnl_link_delete", err));
        }
        LOGI("netlink") << "Link deleted: " << ifname;
        return Outcome::Applied();
    }

    Outcome NetlinkControl::SetAddress(const std::string &ifname, const std::string &cidr)
    {
        const int ifindex = IfIndex(ifname);
        if (ifindex == 0) return Outcome::Failed("no such interface: " + ifname);

        const int family = Netlink::FamilyOf(cidr);
        NlAddr local;
        int err = local.Parse(cidr, family);
        if (err < 0) return Outcome::Failed(NlError("nl_addr_parse(local)", err));

        NlSock s;
        rtnl_addr *a = rtnl_addr_alloc();
        if (!a) return Outcome::Failed("rtnl_addr_alloc failed");
        rtnl_addr_set_ifindex(a, ifindex);
        rtnl_addr_set_family(a, family);
        rtnl_addr_set_local(a, local.addr);

        err = rtnl_addr_add(s.sk, a, 0);
        rtnl_addr_put(a);

        if (err == -NLE_EXIST)
        {
            LOGD("netlink") << "Address already present (idempotent): " << cidr;
            return Outcome::Unchanged("address exists");
        }
        if (err < 0)
        {
            return Outcome::Failed(NlError("rtnl_addr_add", err));
        }
        LOGD("netlink") << "Address " << cidr << " on " << ifname;
        return Outcome::Applied();
    }

    Outcome NetlinkControl::SetMtu(const std::string &ifname, int mtu)
    {
        return ChangeLink(ifname, "SetMtu",
                          [](rtnl_link *l, int v) { rtnl_link_set_mtu(l, static_cast<unsigned int>(v)); },
                          mtu);
    }

    Outcome NetlinkControl::SetLinkUp(const std::string &ifname)
    {
        return ChangeLink(ifname, "SetLinkUp",
                          [](rtnl_link *l, int) { rtnl_link_set_flags(l, IFF_UP); },
                          0);
    }

    // ------------------------------------------------------------- wireguard

    Outcome NetlinkControl::ConfigureWireGuard(const std::string &ifname,
                                               const std::string &private_key,
                                               const WireGuardPeer &peer)
    {
        return WireGuard::SetDevice(ifname, private_key, peer);
    }

    std::optional<WireGuardStatus> NetlinkControl::QueryWireGuard(const std::string &ifname)
    {
        return WireGuard::GetDevice(ifname);
    }

    // ---------------------------------------------------------------- routes

    std::optional<Gateway> NetlinkControl::DefaultGateway(int family)
    {
        NlSock s;
        nl_cache *rcache = nullptr;
        int err = rtnl_route_alloc_cache(s.sk, family, 0, &rcache);
        if (err < 0)
        {
            throw KernelOperationError(NlError("rtnl_route_alloc_cache", err));
        }

        std::optional<Gateway> res;
        std::uint32_t best_metric = 0xffffffffu;

        for (rtnl_route *r = (rtnl_route *)nl_cache_get_first(rcache);
             r;
             r = (rtnl_route *)nl_cache_get_next((nl_object *)r))
        {
            if (rtnl_route_get_table(r) != RT_TABLE_MAIN) continue;
            nl_addr *dst = rtnl_route_get_dst(r);
            if (!dst) continue;
            if (nl_addr_get_family(dst) != family) continue;
            if (nl_addr_get_prefixlen(dst) != 0)   continue;

            rtnl_nexthop *nh = rtnl_route_nexthop_n(r, 0);
            if (!nh) continue;
            nl_addr *gw = rtnl_route_nh_get_gateway(nh);
            if (!gw) continue;

            const std::uint32_t metric = rtnl_route_get_priority(r);
            if (res && metric >= best_metric) continue;

            Gateway g;
            g.address = Netlink::AddrToString(gw);
            g.ifindex = rtnl_route_nh_get_ifindex(nh);
            char name[IF_NAMESIZE] = {};
            if (::if_indextoname(static_cast<unsigned>(g.ifindex), name))
            {
                g.interface_name = name;
            }
            res = g;
            best_metric = metric;
        }

        nl_cache_free(rcache);
        if (res)
        {
            LOGD("netlink") << "Default gateway " << res->address << " dev " << res->interface_name;
        }
        return res;
    }

    Outcome NetlinkControl::AddRoute(const RouteSpec &route)
    {
        RouteMsg msg;
        const std::string problem = BuildRoute(msg, route);
        if (!problem.empty()) return Outcome::Failed(problem);

        NlSock s;
        const int err = rtnl_route_add(s.sk, msg.route, NLM_F_EXCL);
        if (err == -NLE_EXIST)
        {
            LOGD("netlink") << "Route already exists (idempotent): " << route.destination
                            << " table " << route.table;
            return Outcome::Unchanged("route exists");
        }
        if (err < 0)
        {
            LOGE("netlink") << "AddRoute " << route.destination << " table " << route.table
                            << ": " << nl_geterror(err);
            return Outcome::Failed(NlError("rtnl_route_add", err));
        }
        LOGI("netlink") << "Route " << route.destination << " table " << route.table
                        << (route.gateway.empty() ? "" : " via " + route.gateway)
                        << (route.interface_name.empty() ? "" : " dev " + route.interface_name);
        return Outcome::Applied();
    }

    Outcome NetlinkControl::DeleteRoute(const RouteSpec &route)
    {
        RouteMsg msg;
        const std::string problem = BuildRoute(msg, route);
        if (!problem.empty())
        {
            // interface already gone: nothing left to delete
            if (!route.interface_name.empty() && !LinkExists(route.interface_name))
            {
                return Outcome::Unchanged("interface absent");
            }
            return Outcome::Failed(problem);
        }

        NlSock s;
        const int err = rtnl_route_delete(s.sk, msg.route, 0);
        if (err == -NLE_OBJ_NOTFOUND)
        {
            return Outcome::Unchanged("route absent");
        }
        if (err < 0)
        {
            return Outcome::Failed(NlError("rtnl_route_delete", err));
        }
        LOGD("netlink") << "Route deleted: " << route.destination << " table " << route.table;
        return Outcome::Applied();
    }

    // ----------------------------------------------------------------- rules

    std::vector<PolicyRule> NetlinkControl::ListRules()
    {
        NlSock s;
        nl_cache *cache = nullptr;
        int err = rtnl_rule_alloc_cache(s.sk, AF_UNSPEC, &cache);
        if (err < 0)
        {
            throw KernelOperationError(NlError("rtnl_rule_alloc_cache", err));
        }

        std::vector<PolicyRule> out;
        for (nl_object *o = nl_cache_get_first(cache); o; o = nl_cache_get_next(o))
        {
            rtnl_rule *r = reinterpret_cast<rtnl_rule *>(o);
            PolicyRule pr;
            nl_addr *src = rtnl_rule_get_src(r);
            if (src && nl_addr_get_prefixlen(src) != 0)
            {
                pr.source = AsHostCidr(Netlink::AddrToString(src));
            }
            pr.table    = rtnl_rule_get_table(r);
            pr.priority = rtnl_rule_get_prio(r);
            out.push_back(std::move(pr));
        }
        nl_cache_free(cache);
        return out;
    }

    Outcome NetlinkControl::AddRule(const PolicyRule &rule)
    {
        RuleMsg msg;
        const std::string problem = BuildRule(msg, rule);
        if (!problem.empty()) return Outcome::Failed(problem);

        NlSock s;
        const int err = rtnl_rule_add(s.sk, msg.rule, NLM_F_EXCL);
        if (err == -NLE_EXIST)
        {
            return Outcome::Unchanged("rule exists");
        }
        if (err < 0)
        {
            LOGE("netlink") << "AddRule from " << rule.source << " lookup " << rule.table
                            << ": " << nl_geterror(err);
            return Outcome::Failed(NlError("rtnl_rule_add", err));
        }
        LOGD("netlink") << "Rule from " << rule.source << " lookup " << rule.table
                        << " pref " << rule.priority;
        return Outcome::Applied();
    }

    Outcome NetlinkControl::DeleteRule(const PolicyRule &rule)
    {
        RuleMsg msg;
        const std::string problem = BuildRule(msg, rule);
        if (!problem.empty()) return Outcome::Failed(problem);

        NlSock s;
        const int err = rtnl_rule_delete(s.sk, msg.rule, 0);
        if (err == -NLE_OBJ_NOTFOUND)
        {
            return Outcome::Unchanged("rule absent");
        }
        if (err < 0)
        {
            return Outcome::Failed(NlError("rtnl_rule_delete", err));
        }
        LOGD("netlink") << "Rule deleted: from " << rule.source << " pref " << rule.priority;
        return Outcome::Applied();
    }

    // ---------------------------------------------------------------- sysctl

    Outcome NetlinkControl::WriteSysctl(const std::string &key, const std::string &value)
    {
        std::string path = "/proc/sys/" + key;
        std::replace(path.begin() + 10, path.end(), '.', '/');

        LOGT("netlink") << "WriteSysctl: path=" << path << " val=" << value;
        int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd < 0)
        {
            const int e = errno;
            LOGE("netlink") << "WriteSysctl: open failed path=" << path << " errno=" << e;
            return Outcome::Failed(path + ": " + std::strerror(e));
        }

        const ssize_t need = static_cast<ssize_t>(value.size());
        const ssize_t n    = ::write(fd, value.data(), value.size());
        ::close(fd);

        if (n != need)
        {
            LOGW("netlink") << "WriteSysctl: short write path=" << path << " need=" << need << " wrote=" << n;
            return Outcome::Failed("short write to " + path);
        }
        return Outcome::Applied();
    }
} // namespace SafeRoute
