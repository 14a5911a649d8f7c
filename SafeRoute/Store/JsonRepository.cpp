#include "SafeRoute/Store/JsonRepository.hpp"
#include "SafeRoute/Config.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace SafeRoute
{
    namespace
    {
        boost::json::array ToArray(const std::vector<std::string> &items)
        {
            boost::json::array a;
            for (const auto &s : items) a.emplace_back(s);
            return a;
        }

        std::vector<std::string> FromArray(const boost::json::object &o, const char *key)
        {
            std::vector<std::string> out;
            const boost::json::value *v = o.if_contains(key);
            if (!v || !v->is_array()) return out;
            for (const auto &item : v->as_array())
            {
                if (item.is_string()) out.emplace_back(item.as_string().c_str());
            }
            return out;
        }
    } // namespace

    boost::json::object ProfileToJson(const TunnelProfile &p)
    {
        boost::json::object o;
        o["table_id"]        = p.table_id;
        o["interface_name"]  = p.interface_name;
        o["definition_path"] = p.definition_path;
        o["peer_public_key"] = p.peer_public_key;
        o["endpoint_host"]   = p.endpoint_host;
        o["endpoint_port"]   = p.endpoint_port;
        o["allowed_ips"]     = ToArray(p.allowed_ips);
        o["local_address"]   = p.local_address;
        o["dns_servers"]     = ToArray(p.dns_servers);
        if (p.pin)
        {
            o["pin"] = {{"destination", p.pin->destination},
                        {"gateway", p.pin->gateway},
                        {"interface", p.pin->interface_name}};
        }
        return o;
    }

    TunnelProfile ProfileFromJson(const std::string &name, const boost::json::object &o)
    {
        TunnelProfile p;
        p.name            = name;
        p.table_id        = static_cast<std::uint32_t>(Config::RequireInt(o, "table_id"));
        p.interface_name  = Config::OptionalString(o, "interface_name").value_or(DeriveInterfaceName(name));
        p.definition_path = Config::RequireString(o, "definition_path");
        p.peer_public_key = Config::OptionalString(o, "peer_public_key").value_or("");
        p.endpoint_host   = Config::OptionalString(o, "endpoint_host").value_or("");
        p.endpoint_port   = o.if_contains("endpoint_port")
                          ? static_cast<std::uint16_t>(Config::RequireInt(o, "endpoint_port"))
                          : 0;
        p.allowed_ips     = FromArray(o, "allowed_ips");
        p.local_address   = Config::OptionalString(o, "local_address").value_or("");
        p.dns_servers     = FromArray(o, "dns_servers");

        const boost::json::value *pin = o.if_contains("pin");
        if (pin && pin->is_object())
        {
            const boost::json::object &po = pin->as_object();
            EndpointPin ep;
            ep.destination    = Config::RequireString(po, "destination");
            ep.gateway        = Config::OptionalString(po, "gateway").value_or("");
            ep.interface_name = Config::OptionalString(po, "interface").value_or("");
            p.pin = ep;
        }
        return p;
    }

    boost::json::object MappingToJson(const DeviceMapping &m)
    {
        boost::json::object o;
        o["ip"]     = m.ip;
        o["tunnel"] = m.tunnel_name;
        o["active"] = m.active;
        if (m.nickname)
        {
            o["nickname"] = *m.nickname;
        }
        return o;
    }

    // ---------------- profiles ----------------

    JsonProfileRepository::JsonProfileRepository(std::string profiles_file, std::string definitions_dir)
        : profiles_file_(std::move(profiles_file)), definitions_dir_(std::move(definitions_dir))
    {
        fs::create_directories(definitions_dir_);
    }

    std::map<std::string, TunnelProfile> JsonProfileRepository::LoadProfiles()
    {
        std::map<std::string, TunnelProfile> out;
        std::error_code ec;
        if (!fs::exists(profiles_file_, ec))
        {
            LOGD("store") << "No profiles file yet: " << profiles_file_;
            return out;
        }

        boost::json::value jv = Config::ParseFile(profiles_file_);
        if (!jv.is_object())
        {
            LOGE("store") << "Profiles file is not an object: " << profiles_file_;
            throw ConfigInvalid(profiles_file_ + ": root must be an object");
        }
        for (const auto &kv : jv.as_object())
        {
            if (!kv.value().is_object())
            {
                LOGW("store") << "Skipping malformed profile entry '" << std::string(kv.key()) << "'";
                continue;
            }
            const std::string name(kv.key());
            out.emplace(name, ProfileFromJson(name, kv.value().as_object()));
        }
        LOGD("store") << "Loaded " << out.size() << " profile(s) from " << profiles_file_;
        return out;
    }

    void JsonProfileRepository::SaveProfiles(const std::map<std::string, TunnelProfile> &profiles)
    {
        boost::json::object root;
        for (const auto &[name, profile] : profiles)
        {
            root[name] = ProfileToJson(profile);
        }
        Config::WriteFileAtomic(profiles_file_, root);
    }

    std::string JsonProfileRepository::StoreDefinition(const std::string &name, const std::string &source_path)
    {
        const fs::path dest = fs::path(definitions_dir_) / (name + ".conf");
        fs::create_directories(definitions_dir_);
        std::error_code ec;
        if (fs::exists(dest, ec) && fs::equivalent(source_path, dest, ec))
        {
            return dest.string();
        }
        fs::copy_file(source_path, dest, fs::copy_options::overwrite_existing);
        fs::permissions(dest, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
        LOGD("store") << "Stored definition " << source_path << " -> " << dest.string();
        return dest.string();
    }

    void JsonProfileRepository::RemoveDefinition(const std::string &name)
    {
        const fs::path path = fs::path(definitions_dir_) / (name + ".conf");
        std::error_code ec;
        if (!fs::remove(path, ec) && ec)
        {
            LOGW("store") << "Remove definition " << path.string() << " failed: " << ec.message();
        }
    }

    // ---------------- mappings ----------------

    JsonMappingRepository::JsonMappingRepository(std::string mappings_file)
        : mappings_file_(std::move(mappings_file))
    {
    }

    std::vector<DeviceMapping> JsonMappingRepository::LoadMappings()
    {
        std::error_code ec;
        if (!fs::exists(mappings_file_, ec))
        {
            return {};
        }
        return Config::ParseDeclaredMappings(Config::ParseFile(mappings_file_));
    }

    void JsonMappingRepository::SaveMappings(const std::vector<DeviceMapping> &mappings)
    {
        boost::json::array devices;
        for (const auto &m : mappings)
        {
            devices.emplace_back(MappingToJson(m));
        }
        boost::json::object root;
        root["devices"] = std::move(devices);
        Config::WriteFileAtomic(mappings_file_, root);
    }
} // namespace SafeRoute
