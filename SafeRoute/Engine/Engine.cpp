#include "SafeRoute/Engine/Engine.hpp"
#include "SafeRoute/Engine/NetWatcher.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <sys/socket.h>

namespace SafeRoute
{
    Engine::Engine(const Config::Settings &settings,
                   NetworkControl         &net,
                   NatFirewall            &fw,
                   EndpointResolver       &resolver,
                   ProfileRepository      &profiles,
                   MappingRepository      &mappings)
        : net_(net)
        , store_(profiles)
        , dns_(fw)
        , tunnels_(store_, net, resolver)
        , routes_(store_, mappings, net, dns_)
        , host_(net, fw)
        , orchestrator_(store_, tunnels_, routes_, settings.well_known_definitions_dir)
        , lock_(settings.lock_file)
    {
    }

    TunnelProfile Engine::ImportProfile(const std::string &path, const std::string &name)
    {
        auto scope = lock_.Acquire();
        return store_.Import(path, name);
    }

    void Engine::DeleteProfile(const std::string &name)
    {
        auto scope = lock_.Acquire();
        store_.Require(name);

        const Outcome o = tunnels_.Teardown(name);
        if (!o.Ok())
        {
            LOGW("engine") << "Delete " << name << ": teardown failed: " << o.detail;
        }
        routes_.DetachTunnel(name);
        store_.Delete(name);
    }

    std::vector<TunnelProfile> Engine::ListProfiles() const
    {
        return store_.List();
    }

    void Engine::SetupTunnel(const std::string &name)
    {
        auto scope = lock_.Acquire();
        tunnels_.Setup(name);
    }

    Outcome Engine::TeardownTunnel(const std::string &name)
    {
        auto scope = lock_.Acquire();
        return tunnels_.Teardown(name);
    }

    TunnelState Engine::TunnelStateOf(const std::string &name) const
    {
        return tunnels_.State(name);
    }

    std::vector<std::string> Engine::CleanupStaleTunnels()
    {
        auto scope = lock_.Acquire();
        return tunnels_.CleanupStaleTunnels();
    }

    void Engine::AddMapping(const std::string                &ip,
                            const std::string                &tunnel,
                            bool                              active,
                            const std::optional<std::string> &nickname)
    {
        auto scope = lock_.Acquire();
        routes_.AddMapping(ip, tunnel, active, nickname);
    }

    void Engine::CreateMapping(const std::string                &ip,
                               const std::string                &tunnel,
                               bool                              active,
                               const std::optional<std::string> &nickname)
    {
        auto scope = lock_.Acquire();
        routes_.CreateMapping(ip, tunnel, active, nickname);
    }

    void Engine::UpdateMapping(const std::string                &ip,
                               const std::optional<std::string> &tunnel,
                               const std::optional<bool>        &active,
                               const std::optional<std::string> &nickname)
    {
        auto scope = lock_.Acquire();
        routes_.UpdateMapping(ip, tunnel, active, nickname);
    }

    void Engine::RemoveMapping(const std::string &ip)
    {
        auto scope = lock_.Acquire();
        routes_.RemoveMapping(ip);
    }

    std::vector<DeviceMapping> Engine::ListMappings() const
    {
        return routes_.ListMappings();
    }

    SyncReport Engine::SyncRules()
    {
        auto scope = lock_.Acquire();
        return routes_.SyncRules();
    }

    std::vector<NatRule> Engine::DnsRulesFor(const std::string &ip)
    {
        return dns_.GetForClient(ip);
    }

    std::map<std::string, std::vector<NatRule>> Engine::DnsRules()
    {
        return dns_.GetAll();
    }

    StartupReport Engine::Startup(const Config::StartupConfig &cfg)
    {
        auto scope = lock_.Acquire();
        host_.Prepare();
        StartupReport report = orchestrator_.Startup(cfg);
        last_gateway_ = GatewayKey_();
        return report;
    }

    DaemonReport Engine::Run(const std::function<void()> &wait_for_stop)
    {
        DaemonReport report;
        {
            auto scope = lock_.Acquire();
            report.host = host_.Prepare();

            for (const auto &p : store_.List())
            {
                try
                {
                    tunnels_.Setup(p.name);
                    report.up.push_back(p.name);
                }
                catch (const Error &e)
                {
                    LOGW("engine") << "Run: tunnel " << p.name << " not up: " << e.what();
                    report.failed.push_back(p.name);
                }
            }
            report.sync   = routes_.SyncRules();
            last_gateway_ = GatewayKey_();
        }
        LOGI("engine") << "Daemon: " << report.up.size() << " tunnel(s) up, "
                       << report.failed.size() << " failed";

        NetWatcher watcher([this] { RepinIfGatewayChanged(); });
        wait_for_stop();
        watcher.Stop();

        LOGI("engine") << "Daemon stopped";
        return report;
    }

    bool Engine::RepinIfGatewayChanged()
    {
        auto scope = lock_.Acquire();

        // собственные маршруты к endpoint'ам тоже будят watcher: сравниваем шлюз
        const std::string now = GatewayKey_();
        if (now == last_gateway_)
        {
            return false;
        }
        LOGI("engine") << "Default gateway changed: '" << last_gateway_ << "' -> '" << now << "'";
        last_gateway_ = now;

        if (!now.empty())
        {
            tunnels_.RepinEndpoints();
        }
        return true;
    }

    EngineStatus Engine::Status()
    {
        EngineStatus st;
        for (const auto &p : store_.List())
        {
            st.tunnels.push_back(tunnels_.Status(p));
        }
        st.mappings = routes_.ListMappings();
        try
        {
            st.dns = dns_.GetAll();
        }
        catch (const KernelOperationError &e)
        {
            LOGW("engine") << "Status: DNS listing failed: " << e.what();
        }
        return st;
    }

    std::string Engine::GatewayKey_()
    {
        try
        {
            const auto gw = net_.DefaultGateway(AF_INET);
            return gw ? gw->address + "%" + gw->interface_name : std::string();
        }
        catch (const KernelOperationError &e)
        {
            LOGW("engine") << "Default gateway lookup failed: " << e.what();
            return last_gateway_;
        }
    }
} // namespace SafeRoute
