#pragma once

// ProfileStore.hpp — registry of imported tunnel profiles; hands out
// routing-table ids.

#include "SafeRoute/Store/Records.hpp"
#include "SafeRoute/Store/Repository.hpp"
#include "SafeRoute/Store/TunnelDefinition.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace SafeRoute
{
    class ProfileStore
    {
    public:
        /// Loads the persisted registry.
        explicit ProfileStore(ProfileRepository &repo);

        /**
         * @brief Import a definition file under name.
         * @throws Conflict if name (or its interface name) is taken.
         * @throws ConfigInvalid for a bad name or definition; the registry is
         *         left unchanged.
         */
        TunnelProfile Import(const std::string &path, const std::string &name);

        /// @throws NotFound
        void Delete(const std::string &name);

        std::optional<TunnelProfile> Get(const std::string &name) const;

        /// @throws NotFound
        const TunnelProfile &Require(const std::string &name) const;

        bool Contains(const std::string &name) const;

        /// Sorted by name.
        std::vector<TunnelProfile> List() const;

        /// Re-read the managed definition (private key lives only there).
        TunnelDefinition LoadDefinition(const TunnelProfile &profile) const;

        /**
         * @brief Record (or clear) the endpoint route installed for a profile,
         *        so a later process can remove it.
         * @throws NotFound
         */
        void SetPin(const std::string &name, const std::optional<EndpointPin> &pin);

        /// First unused id >= kTableIdBase among live profiles.
        std::uint32_t NextTableId() const;

    private:
        ProfileRepository                    &repo_;
        std::map<std::string, TunnelProfile>  profiles_;
    };

    /// Non-empty, no '/', no NUL; throws ConfigInvalid.
    void ValidateProfileName(const std::string &name);
} // namespace SafeRoute
