#pragma once

// JsonRepository.hpp — file-backed repositories: profiles.json, devices.json
// and <definitions_dir>/<name>.conf. Writes go through temp file + rename.

#include "SafeRoute/Store/Repository.hpp"

#include <boost/json.hpp>

#include <string>

namespace SafeRoute
{
    class JsonProfileRepository : public ProfileRepository
    {
    public:
        JsonProfileRepository(std::string profiles_file, std::string definitions_dir);

        std::map<std::string, TunnelProfile> LoadProfiles() override;
        void SaveProfiles(const std::map<std::string, TunnelProfile> &profiles) override;

        std::string StoreDefinition(const std::string &name, const std::string &source_path) override;
        void RemoveDefinition(const std::string &name) override;

    private:
        std::string profiles_file_;
        std::string definitions_dir_;
    };

    class JsonMappingRepository : public MappingRepository
    {
    public:
        explicit JsonMappingRepository(std::string mappings_file);

        std::vector<DeviceMapping> LoadMappings() override;
        void SaveMappings(const std::vector<DeviceMapping> &mappings) override;

    private:
        std::string mappings_file_;
    };

    boost::json::object ProfileToJson(const TunnelProfile &p);
    TunnelProfile       ProfileFromJson(const std::string &name, const boost::json::object &o);
    boost::json::object MappingToJson(const DeviceMapping &m);
} // namespace SafeRoute
