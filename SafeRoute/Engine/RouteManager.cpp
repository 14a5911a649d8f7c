#include "SafeRoute/Engine/RouteManager.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Kernel/Resolver.hpp"
#include "SafeRoute/Logger.hpp"

#include <algorithm>

namespace SafeRoute
{
    namespace
    {
        // kernel rules allow duplicates; bound the delete loop anyway
        constexpr int kMaxRuleDeletes = 64;

        void ValidateIp(const std::string &ip)
        {
            if (!IsIpLiteral(ip))
            {
                throw ConfigInvalid("not an IP address: " + ip);
            }
        }
    } // namespace

    RouteManager::RouteManager(ProfileStore      &store,
                               MappingRepository &repo,
                               NetworkControl    &net,
                               DNSManager        &dns)
        : store_(store), repo_(repo), net_(net), dns_(dns), mappings_(repo.LoadMappings())
    {
        LOGD("route") << "Loaded " << mappings_.size() << " mapping(s)";
    }

    std::vector<DeviceMapping>::iterator RouteManager::Find_(const std::string &ip)
    {
        return std::find_if(mappings_.begin(), mappings_.end(),
                            [&](const DeviceMapping &m) { return m.ip == ip; });
    }

    void RouteManager::Persist_()
    {
        repo_.SaveMappings(mappings_);
    }

    std::optional<DeviceMapping> RouteManager::GetMapping(const std::string &ip) const
    {
        for (const auto &m : mappings_)
        {
            if (m.ip == ip) return m;
        }
        return std::nullopt;
    }

    void RouteManager::AddMapping(const std::string                &ip,
                                  const std::string                &tunnel,
                                  bool                              active,
                                  const std::optional<std::string> &nickname)
    {
        ValidateIp(ip);
        store_.Require(tunnel);

        auto it = Find_(ip);
        if (it == mappings_.end())
        {
            DeviceMapping m;
            m.ip          = ip;
            m.tunnel_name = tunnel;
            m.active      = active;
            m.nickname    = nickname;
            mappings_.push_back(m);
        }
        else
        {
            it->tunnel_name = tunnel;
            it->active      = active;
            if (nickname)
            {
                it->nickname = nickname;
            }
        }
        Persist_();
        LOGI("route") << "Mapping " << ip << " -> " << tunnel << (active ? "" : " (inactive)");

        if (active)
        {
            ApplyRuleForIp(ip, tunnel);
        }
    }

    void RouteManager::CreateMapping(const std::string                &ip,
                                     const std::string                &tunnel,
                                     bool                              active,
                                     const std::optional<std::string> &nickname)
    {
        if (Find_(ip) != mappings_.end())
        {
            throw Conflict("device already mapped: " + ip);
        }
        AddMapping(ip, tunnel, active, nickname);
    }

    void RouteManager::UpdateMapping(const std::string                &ip,
                                     const std::optional<std::string> &tunnel,
                                     const std::optional<bool>        &active,
                                     const std::optional<std::string> &nickname)
    {
        auto it = Find_(ip);
        if (it == mappings_.end())
        {
            throw NotFound("no mapping for " + ip);
        }
        if (tunnel)
        {
            store_.Require(*tunnel);
            it->tunnel_name = *tunnel;
        }
        if (active)
        {
            it->active = *active;
        }
        if (nickname)
        {
            if (nickname->empty()) it->nickname.reset();
            else                   it->nickname = *nickname;
        }

        const DeviceMapping m = *it;
        Persist_();
        LOGI("route") << "Mapping " << ip << " updated: -> " << m.tunnel_name
                      << (m.active ? "" : " (inactive)");

        if (m.active)
        {
            ApplyRuleForIp(m.ip, m.tunnel_name);
        }
        else
        {
            RemoveRuleForIp(m.ip);
            dns_.CleanupForClient(m.ip);
        }
    }

    void RouteManager::RemoveMapping(const std::string &ip)
    {
        auto it = Find_(ip);
        if (it == mappings_.end())
        {
            throw NotFound("no mapping for " + ip);
        }

        RemoveRuleForIp(ip);
        try
        {
            dns_.CleanupForClient(ip);
        }
        catch (const Error &e)
        {
            LOGW("route") << "Unmap " << ip << ": DNS cleanup failed: " << e.what();
        }

        mappings_.erase(it);
        Persist_();
        LOGI("route") << "Mapping " << ip << " removed";
    }

    void RouteManager::ApplyRuleForIp(const std::string &ip, const std::string &tunnel)
    {
        const TunnelProfile &profile = store_.Require(tunnel);

        const std::size_t old = RemoveRuleForIp(ip);
        if (old)
        {
            LOGD("route") << "Replaced " << old << " rule(s) from " << ip;
        }

        const PolicyRule rule{AsHostCidr(ip), profile.table_id, kDeviceRulePriority};
        const Outcome o = net_.AddRule(rule);
        if (!o.Ok())
        {
            LOGE("route") << "Rule from " << ip << " lookup " << profile.table_id << " failed: " << o.detail;
            throw KernelOperationError("rule from " + ip + " lookup " +
                                       std::to_string(profile.table_id) + ": " + o.detail);
        }
        LOGI("route") << "Rule from " << ip << " lookup " << profile.table_id
                      << " pref " << kDeviceRulePriority << " (" << tunnel << ")";

        dns_.SetupForClient(ip, profile.dns_servers, profile.table_id);
    }

    std::size_t RouteManager::RemoveRuleForIp(const std::string &ip)
    {
        // table 0: match the source whatever table it points at
        const PolicyRule rule{AsHostCidr(ip), 0, kDeviceRulePriority};

        std::size_t removed = 0;
        for (int i = 0; i < kMaxRuleDeletes; ++i)
        {
            const Outcome o = net_.DeleteRule(rule);
            if (o.result == OpResult::Applied)
            {
                ++removed;
                continue;
            }
            if (!o.Ok())
            {
                LOGW("route") << "Delete rule from " << ip << " pref " << kDeviceRulePriority
                              << " failed: " << o.detail;
            }
            break;
        }
        return removed;
    }

    std::size_t RouteManager::DetachTunnel(const std::string &tunnel)
    {
        std::size_t detached = 0;
        for (const auto &m : mappings_)
        {
            if (m.tunnel_name != tunnel) continue;

            RemoveRuleForIp(m.ip);
            try
            {
                dns_.CleanupForClient(m.ip);
            }
            catch (const Error &e)
            {
                LOGW("route") << "Detach " << tunnel << ": DNS cleanup for " << m.ip << " failed: " << e.what();
            }
            ++detached;
        }
        if (detached)
        {
            LOGI("route") << "Detached " << detached << " device(s) from " << tunnel;
        }
        return detached;
    }

    SyncReport RouteManager::SyncRules()
    {
        LOGI("route") << "Sync: " << mappings_.size() << " mapping(s)";
        SyncReport report;

        // 1) DNS redirects of every known mapping
        for (const auto &m : mappings_)
        {
            try
            {
                dns_.CleanupForClient(m.ip);
            }
            catch (const Error &e)
            {
                LOGW("route") << "Sync: DNS cleanup for " << m.ip << " failed: " << e.what();
            }
        }

        // 2) rebuild active, clear inactive
        for (const auto &m : mappings_)
        {
            if (!m.active)
            {
                RemoveRuleForIp(m.ip);
                ++report.cleared;
                continue;
            }

            try
            {
                ApplyRuleForIp(m.ip, m.tunnel_name);
                ++report.applied;
            }
            catch (const NotFound &e)
            {
                LOGW("route") << "Sync: " << m.ip << " -> " << m.tunnel_name << ": " << e.what()
                              << ", clearing";
                RemoveRuleForIp(m.ip);
                ++report.cleared;
            }
            catch (const Error &e)
            {
                LOGW("route") << "Sync: " << m.ip << " -> " << m.tunnel_name << " failed: " << e.what();
                ++report.failed;
            }
        }

        LOGI("route") << "Sync: applied=" << report.applied << " cleared=" << report.cleared
                      << " failed=" << report.failed;
        return report;
    }

    std::size_t RouteManager::FlushAllDeviceRules()
    {
        std::size_t removed = 0;
        for (const PolicyRule &r : net_.ListRules())
        {
            if (r.priority != kDeviceRulePriority || r.source.empty()) continue;

            const Outcome o = net_.DeleteRule(r);
            if (o.result == OpResult::Applied)
            {
                ++removed;
            }
            else if (!o.Ok())
            {
                LOGW("route") << "Flush: rule from " << r.source << " lookup " << r.table
                              << " failed: " << o.detail;
            }
        }
        LOGI("route") << "Flushed " << removed << " device rule(s)";
        return removed;
    }
} // namespace SafeRoute
