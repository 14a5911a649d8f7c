#pragma once

// TunnelManager.hpp — brings one WireGuard tunnel interface up or down.
//
//   Absent -> Creating -> Configured -> Up ; teardown -> Absent

#include "SafeRoute/Engine/ProfileStore.hpp"
#include "SafeRoute/Kernel/NetworkControl.hpp"
#include "SafeRoute/Kernel/Resolver.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace SafeRoute
{
    enum class TunnelState
    {
        Absent,
        Creating,
        Configured,
        Up
    };

    const char *ToString(TunnelState s) noexcept;

    struct TunnelStatus
    {
        std::string                    name;
        std::string                    interface_name;
        std::uint32_t                  table_id = 0;
        TunnelState                    state = TunnelState::Absent;
        bool                           link_present = false;
        std::optional<WireGuardStatus> wireguard;
    };

    class TunnelManager
    {
    public:
        static constexpr int           kMtu              = 1280;
        static constexpr std::uint16_t kKeepaliveSeconds = 25;
        static constexpr std::uint32_t kSelfRulePriority = 50;

        TunnelManager(ProfileStore &store, NetworkControl &net, EndpointResolver &resolver);

        /**
         * @brief Tear down, then create and configure the tunnel of a profile.
         *
         * Interface creation and key/peer programming are fatal; endpoint
         * pinning, the private-table default route and the self rule are
         * best-effort and only logged.
         *
         * @throws NotFound, ConfigInvalid, ResolutionError, KernelOperationError
         */
        void Setup(const std::string &name);

        /// Best-effort; a missing interface is not an error. @throws NotFound
        Outcome Teardown(const std::string &name);

        /// Delete sr_* links no live profile owns; returns deleted names.
        std::vector<std::string> CleanupStaleTunnels();

        /**
         * @brief Lifecycle state. Profiles this process has not touched
         *        report Up when their link exists, Absent otherwise.
         */
        TunnelState State(const std::string &name) const;

        /// Re-add endpoint host routes for every Up tunnel (default gateway changed).
        void RepinEndpoints();

        TunnelStatus Status(const TunnelProfile &profile) const;

    private:
        /// Host route to the resolved peer via the main-table default gateway,
        /// recorded on the profile.
        Outcome PinEndpoint_(const std::string &name, const std::string &endpoint);
        /// Removes the recorded pin unless another profile records the same route.
        void    UnpinEndpoint_(const std::string &name);

        ProfileStore     &store_;
        NetworkControl   &net_;
        EndpointResolver &resolver_;

        std::map<std::string, TunnelState> states_;
        std::map<std::string, std::string> endpoints_;  ///< name -> resolved endpoint
    };

    /// "10.2.0.2/24" -> "10.2.0.2".
    std::string AddressPart(const std::string &cidr);
} // namespace SafeRoute
