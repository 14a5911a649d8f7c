#pragma once

// Orchestrator.hpp — bulk, idempotent convergence to a declared configuration.

#include "SafeRoute/Config.hpp"
#include "SafeRoute/Engine/ProfileStore.hpp"
#include "SafeRoute/Engine/RouteManager.hpp"
#include "SafeRoute/Engine/TunnelManager.hpp"

#include <set>
#include <string>
#include <vector>

namespace SafeRoute
{
    struct StartupReport
    {
        std::vector<std::string> imported;
        std::vector<std::string> import_failed;     ///< definition file paths
        std::vector<std::string> stale_removed;     ///< interface names
        std::set<std::string>    available;         ///< tunnels set up successfully
        std::vector<std::string> setup_failed;
        std::size_t              flushed_rules = 0;
        std::vector<std::string> mappings_applied;  ///< device IPs
        std::vector<std::string> mappings_skipped;
        SyncReport               sync;
    };

    class Orchestrator
    {
    public:
        Orchestrator(ProfileStore  &store,
                     TunnelManager &tunnels,
                     RouteManager  &routes,
                     std::string    well_known_definitions_dir);

        /**
         * @brief Import, clean up, set up and map everything the declared
         *        config names. Per-item failures are logged and reported.
         * @throws ConfigInvalid if the tunnel definitions directory is missing.
         */
        StartupReport Startup(const Config::StartupConfig &cfg);

    private:
        void ImportDirectory_(const std::string &dir, StartupReport &report);

        ProfileStore  &store_;
        TunnelManager &tunnels_;
        RouteManager  &routes_;
        std::string    well_known_dir_;
    };
} // namespace SafeRoute
