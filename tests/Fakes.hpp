#pragma once

// Fakes.hpp — in-memory kernel, firewall, resolver and repositories.
// They keep the kernel's observable quirks: rules allow duplicates across
// tables, identical rules/routes are EEXIST, firewall positions shift on
// delete and handles never repeat.

#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Kernel/NatFirewall.hpp"
#include "SafeRoute/Kernel/NetworkControl.hpp"
#include "SafeRoute/Kernel/Resolver.hpp"
#include "SafeRoute/Store/Repository.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace SafeRoute::Test
{
    class FakeNetworkControl : public NetworkControl
    {
    public:
        struct Link
        {
            std::string                    kind;
            std::vector<std::string>       addresses;
            int                            mtu = 1500;
            bool                           up  = false;
            std::optional<WireGuardPeer>   peer;
            std::string                    private_key;
        };

        FakeNetworkControl()
        {
            links["lo"].kind   = "loopback";
            links["eth0"].kind = "ether";
            gateway = Gateway{"192.168.1.1", "eth0", 2};
            routes.push_back(RouteSpec{"0.0.0.0/0", kMainTable, "192.168.1.1", "eth0"});
        }

        // ---- injected failures: operation name -> interface / source to fail on ("*" = any) ----
        std::multimap<std::string, std::string> failures;

        bool Fails(const std::string &op, const std::string &subject) const
        {
            auto range = failures.equal_range(op);
            for (auto it = range.first; it != range.second; ++it)
            {
                if (it->second == "*" || it->second == subject) return true;
            }
            return false;
        }

        bool LinkExists(const std::string &ifname) override
        {
            return links.count(ifname) != 0;
        }

        std::vector<std::string> ListLinks() override
        {
            std::vector<std::string> out;
            for (const auto &kv : links) out.push_back(kv.first);
            return out;
        }

        Outcome CreateLink(const std::string &ifname, const std::string &kind) override
        {
            if (Fails("CreateLink", ifname)) return Outcome::Failed("Operation not supported");
            if (links.count(ifname)) return Outcome::Unchanged("exists");
            links[ifname].kind = kind;
            ++links_created;
            return Outcome::Applied();
        }

        Outcome DeleteLink(const std::string &ifname) override
        {
            if (Fails("DeleteLink", ifname)) return Outcome::Failed("Device or resource busy");
            if (!links.erase(ifname)) return Outcome::Unchanged("no such device");
            // routes through the link go with it
            routes.erase(std::remove_if(routes.begin(), routes.end(),
                                        [&](const RouteSpec &r) { return r.interface_name == ifname; }),
                         routes.end());
            return Outcome::Applied();
        }

        Outcome SetAddress(const std::string &ifname, const std::string &cidr) override
        {
            if (Fails("SetAddress", ifname)) return Outcome::Failed("Cannot assign address");
            auto it = links.find(ifname);
            if (it == links.end()) return Outcome::Failed("No such device");
            auto &a = it->second.addresses;
            if (std::find(a.begin(), a.end(), cidr) != a.end()) return Outcome::Unchanged("exists");
            a.push_back(cidr);
            return Outcome::Applied();
        }

        Outcome SetMtu(const std::string &ifname, int mtu) override
        {
            auto it = links.find(ifname);
            if (it == links.end()) return Outcome::Failed("No such device");
            it->second.mtu = mtu;
            return Outcome::Applied();
        }

        Outcome SetLinkUp(const std::string &ifname) override
        {
            auto it = links.find(ifname);
            if (it == links.end()) return Outcome::Failed("No such device");
            it->second.up = true;
            return Outcome::Applied();
        }

        Outcome ConfigureWireGuard(const std::string   &ifname,
                                   const std::string   &private_key,
                                   const WireGuardPeer &peer) override
        {
            if (Fails("ConfigureWireGuard", ifname)) return Outcome::Failed("Invalid argument");
            auto it = links.find(ifname);
            if (it == links.end() || it->second.kind != "wireguard") return Outcome::Failed("No such device");
            it->second.private_key = private_key;
            it->second.peer        = peer;
            return Outcome::Applied();
        }

        std::optional<WireGuardStatus> QueryWireGuard(const std::string &ifname) override
        {
            auto it = links.find(ifname);
            if (it == links.end() || !it->second.peer) return std::nullopt;
            WireGuardStatus st;
            st.peer_public_key = it->second.peer->public_key;
            st.peer_endpoint   = it->second.peer->endpoint_address + ":" +
                                 std::to_string(it->second.peer->endpoint_port);
            return st;
        }

        std::optional<Gateway> DefaultGateway(int family) override
        {
            if (family != AF_INET) return std::nullopt;
            return gateway;
        }

        Outcome AddRoute(const RouteSpec &route) override
        {
            if (Fails("AddRoute", route.destination)) return Outcome::Failed("Network is unreachable");
            if (!route.interface_name.empty() && !links.count(route.interface_name))
            {
                return Outcome::Failed("No such device");
            }
            for (const auto &r : routes)
            {
                if (r.destination == route.destination && r.table == route.table)
                {
                    return Outcome::Unchanged("exists");
                }
            }
            routes.push_back(route);
            return Outcome::Applied();
        }

        Outcome DeleteRoute(const RouteSpec &route) override
        {
            for (auto it = routes.begin(); it != routes.end(); ++it)
            {
                if (it->destination == route.destination && it->table == route.table &&
                    (route.gateway.empty() || it->gateway == route.gateway))
                {
                    routes.erase(it);
                    return Outcome::Applied();
                }
            }
            return Outcome::Unchanged("no such route");
        }

        std::vector<PolicyRule> ListRules() override
        {
            return rules;
        }

        Outcome AddRule(const PolicyRule &rule) override
        {
            if (Fails("AddRule", rule.source)) return Outcome::Failed("Operation not permitted");
            if (std::find(rules.begin(), rules.end(), rule) != rules.end())
            {
                return Outcome::Unchanged("exists");
            }
            rules.push_back(rule);
            return Outcome::Applied();
        }

        Outcome DeleteRule(const PolicyRule &rule) override
        {
            for (auto it = rules.begin(); it != rules.end(); ++it)
            {
                if (it->source == rule.source && it->priority == rule.priority &&
                    (rule.table == 0 || it->table == rule.table))
                {
                    rules.erase(it);
                    return Outcome::Applied();
                }
            }
            return Outcome::Unchanged("no such rule");
        }

        Outcome WriteSysctl(const std::string &key, const std::string &value) override
        {
            if (Fails("WriteSysctl", key)) return Outcome::Failed("Permission denied");
            sysctls[key] = value;
            return Outcome::Applied();
        }

        // helpers for assertions
        std::size_t RulesFrom(const std::string &source) const
        {
            return static_cast<std::size_t>(std::count_if(rules.begin(), rules.end(),
                [&](const PolicyRule &r) { return r.source == source; }));
        }

        bool HasRule(const PolicyRule &rule) const
        {
            return std::find(rules.begin(), rules.end(), rule) != rules.end();
        }

        bool HasRoute(const std::string &destination, std::uint32_t table) const
        {
            return std::any_of(routes.begin(), routes.end(), [&](const RouteSpec &r)
            {
                return r.destination == destination && r.table == table;
            });
        }

        std::map<std::string, Link>        links;
        std::vector<RouteSpec>             routes;
        std::vector<PolicyRule>            rules;
        std::map<std::string, std::string> sysctls;
        std::optional<Gateway>             gateway;
        std::size_t                        links_created = 0;
    };

    class FakeNatFirewall : public NatFirewall
    {
    public:
        bool        chain_exists    = false;
        bool        fail_list       = false;
        std::string fail_insert_protocol;   ///< "udp" / "tcp": insert of that protocol fails
        std::string forwarding_prefix;

        /// Every rule of the chain, head first (foreign rules included).
        std::vector<NatRule> chain;

        Outcome EnsureDnatChain() override
        {
            if (chain_exists) return Outcome::Unchanged("exists");
            chain_exists = true;
            return Outcome::Applied();
        }

        std::vector<NatRule> ListDnatRules() override
        {
            if (fail_list) throw KernelOperationError("nft list chain: Operation not permitted");
            std::vector<NatRule> out;
            for (std::size_t i = 0; i < chain.size(); ++i)
            {
                NatRule r = chain[i];
                r.position = i + 1;
                out.push_back(r);
            }
            return out;
        }

        Outcome InsertDnatRule(const NatRule &rule) override
        {
            if (!chain_exists) return Outcome::Failed("No such file or directory");
            if (!fail_insert_protocol.empty() && rule.protocol == fail_insert_protocol)
            {
                return Outcome::Failed("Operation not permitted");
            }
            // nft: "dnat ip to" needs an IPv4 source match, "dnat ip6 to" an IPv6 one
            if ((rule.source.find(':') == std::string::npos) != (rule.to_address.find(':') == std::string::npos))
            {
                return Outcome::Failed("Error: conflicting protocols specified: ip vs. ip6");
            }
            NatRule r = rule;
            r.handle  = next_handle_++;
            chain.insert(chain.begin(), r);
            return Outcome::Applied();
        }

        Outcome DeleteDnatRule(const NatRule &rule) override
        {
            for (auto it = chain.begin(); it != chain.end(); ++it)
            {
                if (it->handle == rule.handle)
                {
                    chain.erase(it);
                    return Outcome::Applied();
                }
            }
            return Outcome::Unchanged("no such rule");
        }

        Outcome EnsureForwarding(const std::string &interface_prefix) override
        {
            forwarding_prefix = interface_prefix;
            return Outcome::Applied();
        }

        /// Rules sourced from ip.
        std::vector<NatRule> From(const std::string &ip) const
        {
            std::vector<NatRule> out;
            for (const auto &r : chain)
            {
                if (r.source == ip) out.push_back(r);
            }
            return out;
        }

    private:
        std::uint64_t next_handle_ = 2;
    };

    class FakeResolver : public EndpointResolver
    {
    public:
        std::map<std::string, std::string> names;
        std::size_t                        calls = 0;

        std::string Resolve(const std::string &host) override
        {
            ++calls;
            if (IsIpLiteral(host)) return host;
            auto it = names.find(host);
            if (it == names.end()) throw ResolutionError("cannot resolve " + host);
            return it->second;
        }
    };

    /// Profiles in memory; definitions stay where the test wrote them.
    class MemoryProfileRepository : public ProfileRepository
    {
    public:
        std::map<std::string, TunnelProfile> saved;
        std::size_t                          saves = 0;
        bool                                 fail_save = false;

        std::map<std::string, TunnelProfile> LoadProfiles() override { return saved; }

        void SaveProfiles(const std::map<std::string, TunnelProfile> &profiles) override
        {
            if (fail_save) throw std::runtime_error("disk full");
            saved = profiles;
            ++saves;
        }

        std::string StoreDefinition(const std::string &, const std::string &source_path) override
        {
            return source_path;
        }

        void RemoveDefinition(const std::string &name) override
        {
            removed.insert(name);
        }

        std::set<std::string> removed;
    };

    class MemoryMappingRepository : public MappingRepository
    {
    public:
        std::vector<DeviceMapping> saved;

        std::vector<DeviceMapping> LoadMappings() override { return saved; }
        void SaveMappings(const std::vector<DeviceMapping> &mappings) override { saved = mappings; }
    };

    /// Unique directory under the system temp dir, removed on destruction.
    class TempDir
    {
    public:
        TempDir()
        {
            static std::atomic<int> counter{0};
            path_ = std::filesystem::temp_directory_path() /
                    ("saferoute-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir&)            = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path &Path() const { return path_; }

        std::string Write(const std::string &name, const std::string &content) const
        {
            const auto file = path_ / name;
            std::filesystem::create_directories(file.parent_path());
            std::ofstream(file, std::ios::binary) << content;
            return file.string();
        }

    private:
        std::filesystem::path path_;
    };

    /// Valid definition text for the given tunnel address / DNS / endpoint.
    inline std::string Definition(const std::string &address,
                                  const std::string &dns,
                                  const std::string &endpoint = "198.51.100.7:51820")
    {
        std::string text =
            "[Interface]\n"
            "PrivateKey = yAnz5TF+lXXJte14tji3zlMNq+hd2rYUIgJBgB3fBmk=\n"
            "Address = " + address + "\n";
        if (!dns.empty())
        {
            text += "DNS = " + dns + "\n";
        }
        text +=
            "\n[Peer]\n"
            "PublicKey = xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=\n"
            "Endpoint = " + endpoint + "\n"
            "AllowedIPs = 0.0.0.0/0\n";
        return text;
    }
} // namespace SafeRoute::Test
