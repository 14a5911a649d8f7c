#pragma once

// RouteManager.hpp — device -> tunnel policy rules ("from <ip> lookup <table>")
// and the persisted mapping list behind them.

#include "SafeRoute/Engine/DNSManager.hpp"
#include "SafeRoute/Engine/ProfileStore.hpp"
#include "SafeRoute/Kernel/NetworkControl.hpp"
#include "SafeRoute/Store/Repository.hpp"

#include <optional>
#include <string>
#include <vector>

namespace SafeRoute
{
    struct SyncReport
    {
        std::size_t applied  = 0;   ///< active mappings converged
        std::size_t cleared  = 0;   ///< inactive / orphaned mappings cleared
        std::size_t failed   = 0;
    };

    class RouteManager
    {
    public:
        /// Shared by every device rule.
        static constexpr std::uint32_t kDeviceRulePriority = 1000;

        RouteManager(ProfileStore      &store,
                     MappingRepository &repo,
                     NetworkControl    &net,
                     DNSManager        &dns);

        /**
         * @brief Upsert; an unset nickname keeps the stored one. Active
         *        mappings are applied immediately.
         * @throws NotFound (unknown tunnel), ConfigInvalid (bad ip), KernelOperationError
         */
        void AddMapping(const std::string                &ip,
                        const std::string                &tunnel,
                        bool                              active,
                        const std::optional<std::string> &nickname = std::nullopt);

        /// Strict insert. @throws Conflict if ip is already mapped.
        void CreateMapping(const std::string                &ip,
                           const std::string                &tunnel,
                           bool                              active,
                           const std::optional<std::string> &nickname = std::nullopt);

        /**
         * @brief Change selected fields; an empty nickname clears it.
         *        Live state follows: re-applied when active, removed otherwise.
         * @throws NotFound
         */
        void UpdateMapping(const std::string                &ip,
                           const std::optional<std::string> &tunnel,
                           const std::optional<bool>        &active,
                           const std::optional<std::string> &nickname);

        /// Drops the mapping, its rule and its DNS redirect. @throws NotFound
        void RemoveMapping(const std::string &ip);

        std::vector<DeviceMapping> ListMappings() const { return mappings_; }
        std::optional<DeviceMapping> GetMapping(const std::string &ip) const;

        /**
         * @brief Delete-then-add the rule for ip, then install its DNS redirect.
         * @throws NotFound, KernelOperationError
         */
        void ApplyRuleForIp(const std::string &ip, const std::string &tunnel);

        /// Removes every device rule sourced from ip. Returns how many.
        std::size_t RemoveRuleForIp(const std::string &ip);

        /// Remove live rule and DNS state of every mapping that points at tunnel.
        /// The mappings stay; they are skipped until the tunnel comes back.
        std::size_t DetachTunnel(const std::string &tunnel);

        /// Clear DNS for all mappings, then rebuild active and clear inactive ones.
        SyncReport SyncRules();

        /// Delete every rule at kDeviceRulePriority. Returns how many.
        std::size_t FlushAllDeviceRules();

    private:
        std::vector<DeviceMapping>::iterator Find_(const std::string &ip);
        void Persist_();

        ProfileStore               &store_;
        MappingRepository          &repo_;
        NetworkControl             &net_;
        DNSManager                 &dns_;
        std::vector<DeviceMapping>  mappings_;
    };
} // namespace SafeRoute
