#include "SafeRoute/Engine/DNSManager.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <algorithm>
#include <initializer_list>

namespace SafeRoute
{
    namespace
    {
        bool IsRedirectFor(const NatRule &r, const std::string &ip)
        {
            return r.source == ip && r.dport == DNSManager::kDnsPort;
        }

        bool IsV6(const std::string &address)
        {
            return address.find(':') != std::string::npos;
        }

        // DNAT cannot cross address families: first server of the client's family
        const std::string *PrimaryFor(const std::string &ip, const std::vector<std::string> &servers)
        {
            for (const auto &s : servers)
            {
                if (IsV6(s) == IsV6(ip)) return &s;
            }
            return nullptr;
        }
    } // namespace

    DNSManager::DNSManager(NatFirewall &fw) : fw_(fw)
    {
    }

    void DNSManager::SetupForClient(const std::string              &ip,
                                    const std::vector<std::string> &dns_servers,
                                    std::uint32_t                   table_id)
    {
        if (dns_servers.empty())
        {
            LOGW("dns") << "No DNS servers for " << ip << " (table " << table_id << "), redirect skipped";
            return;
        }
        const std::string *found = PrimaryFor(ip, dns_servers);
        if (!found)
        {
            LOGW("dns") << "No " << (IsV6(ip) ? "IPv6" : "IPv4") << " DNS server for " << ip
                        << " (table " << table_id << "), redirect skipped";
            CleanupForClient(ip);
            tracked_.erase(ip);
            return;
        }
        const std::string &primary = *found;

        const Outcome chain = fw_.EnsureDnatChain();
        if (!chain.Ok())
        {
            throw KernelOperationError("DNAT chain unavailable: " + chain.detail);
        }

        const std::size_t stale = CleanupForClient(ip);
        if (stale)
        {
            LOGD("dns") << "Removed " << stale << " previous redirect(s) for " << ip;
        }

        for (const char *proto : {"udp", "tcp"})
        {
            NatRule r;
            r.source     = ip;
            r.protocol   = proto;
            r.dport      = kDnsPort;
            r.to_address = primary;
            r.to_port    = kDnsPort;
            r.comment    = kRuleComment;

            const Outcome o = fw_.InsertDnatRule(r);
            if (!o.Ok())
            {
                LOGE("dns") << "Redirect " << proto << " " << ip << " -> " << primary << " failed: " << o.detail;
                try
                {
                    CleanupForClient(ip);
                }
                catch (const KernelOperationError &e)
                {
                    LOGW("dns") << "Cleanup after failed redirect for " << ip << ": " << e.what();
                }
                tracked_.erase(ip);
                throw KernelOperationError("DNS redirect for " + ip + ": " + o.detail);
            }
        }

        tracked_[ip] = DnsAssignment{dns_servers, primary, table_id};
        LOGI("dns") << "DNS of " << ip << " -> " << primary << " (table " << table_id << ")";
    }

    std::size_t DNSManager::CleanupForClient(const std::string &ip)
    {
        std::vector<NatRule> matches;
        for (const NatRule &r : fw_.ListDnatRules())
        {
            if (IsRedirectFor(r, ip)) matches.push_back(r);
        }

        // удаление сдвигает позиции правил ниже — идём снизу вверх
        std::sort(matches.begin(), matches.end(),
                  [](const NatRule &a, const NatRule &b) { return a.position > b.position; });

        std::size_t removed = 0;
        for (const NatRule &r : matches)
        {
            const Outcome o = fw_.DeleteDnatRule(r);
            if (o.result == OpResult::Applied)
            {
                ++removed;
            }
            else if (!o.Ok())
            {
                LOGW("dns") << "Delete redirect " << r.protocol << " " << ip << " at " << r.position
                            << " (handle " << r.handle << ") failed: " << o.detail;
            }
        }

        tracked_.erase(ip);
        return removed;
    }

    std::vector<NatRule> DNSManager::GetForClient(const std::string &ip)
    {
        std::vector<NatRule> out;
        for (const NatRule &r : fw_.ListDnatRules())
        {
            if (IsRedirectFor(r, ip)) out.push_back(r);
        }
        return out;
    }

    std::map<std::string, std::vector<NatRule>> DNSManager::GetAll()
    {
        std::map<std::string, std::vector<NatRule>> out;
        for (const NatRule &r : fw_.ListDnatRules())
        {
            if (r.dport == kDnsPort && !r.source.empty())
            {
                out[r.source].push_back(r);
            }
        }
        return out;
    }
} // namespace SafeRoute
