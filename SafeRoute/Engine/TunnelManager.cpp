#include "SafeRoute/Engine/TunnelManager.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <sys/socket.h>

#include <set>

namespace SafeRoute
{
    const char *ToString(TunnelState s) noexcept
    {
        switch (s)
        {
            case TunnelState::Absent:     return "absent";
            case TunnelState::Creating:   return "creating";
            case TunnelState::Configured: return "configured";
            case TunnelState::Up:         return "up";
        }
        return "?";
    }

    std::string AddressPart(const std::string &cidr)
    {
        const auto slash = cidr.find('/');
        return slash == std::string::npos ? cidr : cidr.substr(0, slash);
    }

    namespace
    {
        bool IsV6(const std::string &address)
        {
            return address.find(':') != std::string::npos;
        }

        PolicyRule SelfRule(const TunnelProfile &p)
        {
            return PolicyRule{AsHostCidr(AddressPart(p.local_address)), p.table_id,
                              TunnelManager::kSelfRulePriority};
        }
    } // namespace

    TunnelManager::TunnelManager(ProfileStore &store, NetworkControl &net, EndpointResolver &resolver)
        : store_(store), net_(net), resolver_(resolver)
    {
    }

    void TunnelManager::Setup(const std::string &name)
    {
        const TunnelProfile profile = store_.Require(name);
        const std::string  &ifname  = profile.interface_name;

        LOGI("tunnel") << "Setup " << name << ": if=" << ifname << " table=" << profile.table_id;

        // 1) повторная настройка всегда начинается с чистого листа
        const Outcome previous = Teardown(name);
        if (previous.result == OpResult::Applied)
        {
            LOGD("tunnel") << "Setup " << name << ": previous " << ifname << " removed";
        }

        // 2) definition + endpoint
        const TunnelDefinition def = store_.LoadDefinition(profile);
        const std::string endpoint = resolver_.Resolve(profile.endpoint_host);
        endpoints_[name] = endpoint;

        // 3) interface (fatal)
        states_[name] = TunnelState::Creating;
        auto fatal = [&](const char *step, const Outcome &o)
        {
            LOGE("tunnel") << "Setup " << name << ": " << step << " on " << ifname << " failed: " << o.detail;
            const Outcome cleanup = net_.DeleteLink(ifname);
            if (!cleanup.Ok())
            {
                LOGW("tunnel") << "Setup " << name << ": cleanup of " << ifname << " failed: " << cleanup.detail;
            }
            states_[name] = TunnelState::Absent;
            throw KernelOperationError(std::string(step) + " " + ifname + ": " + o.detail);
        };

        Outcome o = net_.CreateLink(ifname, "wireguard");
        if (!o.Ok()) fatal("create link", o);

        o = net_.SetAddress(ifname, profile.local_address);
        if (!o.Ok()) fatal("set address", o);

        o = net_.SetMtu(ifname, kMtu);
        if (!o.Ok()) fatal("set mtu", o);

        o = net_.SetLinkUp(ifname);
        if (!o.Ok()) fatal("link up", o);

        // 4) key + single peer (fatal)
        WireGuardPeer peer;
        peer.public_key        = profile.peer_public_key;
        peer.endpoint_address  = endpoint;
        peer.endpoint_port     = profile.endpoint_port;
        peer.allowed_ips       = profile.allowed_ips;
        peer.keepalive_seconds = kKeepaliveSeconds;

        o = net_.ConfigureWireGuard(ifname, def.private_key, peer);
        if (!o.Ok()) fatal("configure wireguard", o);
        states_[name] = TunnelState::Configured;

        // 5) endpoint pinning (best-effort)
        o = PinEndpoint_(name, endpoint);
        if (!o.Ok())
        {
            LOGW("tunnel") << "Setup " << name << ": endpoint pin " << endpoint << " failed: " << o.detail;
        }

        // 6) default route in the private table (best-effort)
        const bool v6 = IsV6(profile.local_address);
        o = net_.AddRoute(RouteSpec{v6 ? "::/0" : "0.0.0.0/0", profile.table_id, "", ifname});
        if (!o.Ok())
        {
            LOGW("tunnel") << "Setup " << name << ": default route table " << profile.table_id
                           << " dev " << ifname << " failed: " << o.detail;
        }

        // 7) host traffic from the tunnel address uses the private table (best-effort)
        const PolicyRule self = SelfRule(profile);
        o = net_.DeleteRule(self);
        if (!o.Ok())
        {
            LOGW("tunnel") << "Setup " << name << ": stale rule from " << self.source << ": " << o.detail;
        }
        o = net_.AddRule(self);
        if (!o.Ok())
        {
            LOGW("tunnel") << "Setup " << name << ": rule from " << self.source << " lookup "
                           << self.table << " failed: " << o.detail;
        }

        states_[name] = TunnelState::Up;
        LOGI("tunnel") << "Tunnel " << name << " up (" << ifname << ", peer " << endpoint
                       << ":" << profile.endpoint_port << ")";
    }

    Outcome TunnelManager::Teardown(const std::string &name)
    {
        const TunnelProfile &profile = store_.Require(name);

        const Outcome rule = net_.DeleteRule(SelfRule(profile));
        if (!rule.Ok())
        {
            LOGW("tunnel") << "Teardown " << name << ": self rule: " << rule.detail;
        }
        UnpinEndpoint_(name);

        const Outcome link = net_.DeleteLink(profile.interface_name);
        if (!link.Ok())
        {
            LOGW("tunnel") << "Teardown " << name << ": delete " << profile.interface_name
                           << " failed: " << link.detail;
        }
        else if (link.result == OpResult::Applied)
        {
            LOGI("tunnel") << "Teardown " << name << ": " << profile.interface_name << " removed";
        }

        states_[name] = TunnelState::Absent;
        return link;
    }

    std::vector<std::string> TunnelManager::CleanupStaleTunnels()
    {
        std::set<std::string> owned;
        for (const auto &p : store_.List())
        {
            owned.insert(p.interface_name);
        }

        std::vector<std::string> removed;
        for (const auto &link : net_.ListLinks())
        {
            if (link.rfind(kInterfacePrefix, 0) != 0) continue;
            if (owned.count(link)) continue;

            const Outcome o = net_.DeleteLink(link);
            if (o.Ok())
            {
                LOGI("tunnel") << "Removed stale interface " << link;
                removed.push_back(link);
            }
            else
            {
                LOGW("tunnel") << "Stale interface " << link << " not removed: " << o.detail;
            }
        }
        return removed;
    }

    TunnelState TunnelManager::State(const std::string &name) const
    {
        auto it = states_.find(name);
        if (it != states_.end()) return it->second;

        const TunnelProfile &profile = store_.Require(name);
        return net_.LinkExists(profile.interface_name) ? TunnelState::Up : TunnelState::Absent;
    }

    void TunnelManager::RepinEndpoints()
    {
        for (const auto &kv : endpoints_)
        {
            auto st = states_.find(kv.first);
            if (st == states_.end() || st->second != TunnelState::Up) continue;

            UnpinEndpoint_(kv.first);
            const Outcome o = PinEndpoint_(kv.first, kv.second);
            if (!o.Ok())
            {
                LOGW("tunnel") << "Repin " << kv.first << " (" << kv.second << ") failed: " << o.detail;
            }
        }
    }

    TunnelStatus TunnelManager::Status(const TunnelProfile &profile) const
    {
        TunnelStatus st;
        st.name           = profile.name;
        st.interface_name = profile.interface_name;
        st.table_id       = profile.table_id;
        st.link_present   = net_.LinkExists(profile.interface_name);
        st.state          = State(profile.name);
        if (st.link_present)
        {
            st.wireguard = net_.QueryWireGuard(profile.interface_name);
        }
        return st;
    }

    Outcome TunnelManager::PinEndpoint_(const std::string &name, const std::string &endpoint)
    {
        std::optional<Gateway> gw;
        try
        {
            gw = net_.DefaultGateway(IsV6(endpoint) ? AF_INET6 : AF_INET);
        }
        catch (const KernelOperationError &e)
        {
            return Outcome::Failed(e.what());
        }
        if (!gw)
        {
            return Outcome::Failed("no default gateway");
        }

        const RouteSpec route{AsHostCidr(endpoint), kMainTable, gw->address, gw->interface_name};
        const Outcome o = net_.AddRoute(route);
        if (o.Ok())
        {
            store_.SetPin(name, EndpointPin{route.destination, route.gateway, route.interface_name});
            LOGD("tunnel") << "Pinned " << route.destination << " via " << gw->address
                           << " dev " << gw->interface_name;
        }
        return o;
    }

    void TunnelManager::UnpinEndpoint_(const std::string &name)
    {
        const std::optional<EndpointPin> pin = store_.Require(name).pin;
        if (!pin) return;

        // общий endpoint у нескольких туннелей: маршрут нужен оставшимся
        for (const auto &other : store_.List())
        {
            if (other.name == name || !other.pin) continue;
            if (other.pin->destination == pin->destination && other.pin->gateway == pin->gateway)
            {
                LOGD("tunnel") << "Unpin " << name << ": " << pin->destination << " still used by " << other.name;
                store_.SetPin(name, std::nullopt);
                return;
            }
        }

        const Outcome o = net_.DeleteRoute(RouteSpec{pin->destination, kMainTable, pin->gateway, pin->interface_name});
        if (!o.Ok())
        {
            LOGW("tunnel") << "Unpin " << name << ": " << pin->destination << " via " << pin->gateway
                           << " failed: " << o.detail;
            return;
        }
        store_.SetPin(name, std::nullopt);
    }
} // namespace SafeRoute
