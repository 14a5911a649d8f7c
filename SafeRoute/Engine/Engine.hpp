#pragma once

// Engine.hpp — фасад движка: владеет компонентами, сериализует мутации
// через EngineLock. Front ends (CLI, daemon) talk only to this class.

#include "SafeRoute/Config.hpp"
#include "SafeRoute/Engine/DNSManager.hpp"
#include "SafeRoute/Engine/EngineLock.hpp"
#include "SafeRoute/Engine/HostForwarding.hpp"
#include "SafeRoute/Engine/Orchestrator.hpp"
#include "SafeRoute/Engine/ProfileStore.hpp"
#include "SafeRoute/Engine/RouteManager.hpp"
#include "SafeRoute/Engine/TunnelManager.hpp"
#include "SafeRoute/Kernel/NatFirewall.hpp"
#include "SafeRoute/Kernel/NetworkControl.hpp"
#include "SafeRoute/Kernel/Resolver.hpp"
#include "SafeRoute/Store/Repository.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace SafeRoute
{
    struct EngineStatus
    {
        std::vector<TunnelStatus>                    tunnels;
        std::vector<DeviceMapping>                   mappings;
        std::map<std::string, std::vector<NatRule>>  dns;
    };

    struct DaemonReport
    {
        HostReport               host;
        std::vector<std::string> up;
        std::vector<std::string> failed;
        SyncReport               sync;
    };

    class Engine
    {
    public:
        Engine(const Config::Settings &settings,
               NetworkControl         &net,
               NatFirewall            &fw,
               EndpointResolver       &resolver,
               ProfileRepository      &profiles,
               MappingRepository      &mappings);

        Engine(const Engine&)            = delete;
        Engine& operator=(const Engine&) = delete;

        // ---- profiles ----
        TunnelProfile ImportProfile(const std::string &path, const std::string &name);

        /// Tear the tunnel down (best-effort), detach its devices, then forget it.
        /// @throws NotFound
        void DeleteProfile(const std::string &name);

        std::vector<TunnelProfile> ListProfiles() const;

        // ---- tunnels ----
        void        SetupTunnel(const std::string &name);
        Outcome     TeardownTunnel(const std::string &name);
        TunnelState TunnelStateOf(const std::string &name) const;
        std::vector<std::string> CleanupStaleTunnels();

        // ---- device mappings ----
        void AddMapping(const std::string                &ip,
                        const std::string                &tunnel,
                        bool                              active,
                        const std::optional<std::string> &nickname = std::nullopt);
        void CreateMapping(const std::string                &ip,
                           const std::string                &tunnel,
                           bool                              active,
                           const std::optional<std::string> &nickname = std::nullopt);
        void UpdateMapping(const std::string                &ip,
                           const std::optional<std::string> &tunnel,
                           const std::optional<bool>        &active,
                           const std::optional<std::string> &nickname);
        void RemoveMapping(const std::string &ip);
        std::vector<DeviceMapping> ListMappings() const;

        SyncReport SyncRules();

        // ---- DNS (live firewall view) ----
        std::vector<NatRule>                        DnsRulesFor(const std::string &ip);
        std::map<std::string, std::vector<NatRule>> DnsRules();

        // ---- bulk ----
        /// Host preparation, then declared-config reconciliation.
        StartupReport Startup(const Config::StartupConfig &cfg);

        /**
         * @brief Daemon mode: host preparation, every profile set up, rules
         *        synced; then a route watcher re-pins endpoints whenever the
         *        default gateway moves, until wait_for_stop returns.
         * @throws KernelOperationError if the route watcher cannot subscribe.
         */
        DaemonReport Run(const std::function<void()> &wait_for_stop);

        /// Re-pin endpoint routes when the IPv4 default gateway differs from
        /// the last one seen. Returns true if it did.
        bool RepinIfGatewayChanged();

        EngineStatus Status();

    private:
        std::string GatewayKey_();

        NetworkControl &net_;

        ProfileStore   store_;
        DNSManager     dns_;
        TunnelManager  tunnels_;
        RouteManager   routes_;
        HostForwarding host_;
        Orchestrator   orchestrator_;
        EngineLock     lock_;

        std::string    last_gateway_;
    };
} // namespace SafeRoute
