#pragma once

// Repository.hpp — persistence seams for profiles and device mappings.

#include "SafeRoute/Store/Records.hpp"

#include <map>
#include <string>
#include <vector>

namespace SafeRoute
{
    class ProfileRepository
    {
    public:
        virtual ~ProfileRepository() = default;

        virtual std::map<std::string, TunnelProfile> LoadProfiles() = 0;
        virtual void SaveProfiles(const std::map<std::string, TunnelProfile> &profiles) = 0;

        /// Copy a definition into managed storage; returns the stored path.
        virtual std::string StoreDefinition(const std::string &name, const std::string &source_path) = 0;
        virtual void RemoveDefinition(const std::string &name) = 0;
    };

    class MappingRepository
    {
    public:
        virtual ~MappingRepository() = default;

        /// Ordered as last saved.
        virtual std::vector<DeviceMapping> LoadMappings() = 0;
        virtual void SaveMappings(const std::vector<DeviceMapping> &mappings) = 0;
    };
} // namespace SafeRoute
