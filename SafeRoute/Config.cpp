#include "SafeRoute/Config.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Config
{
    namespace
    {
        const boost::json::value &RequireKey(const boost::json::object &o, const char *key)
        {
            const boost::json::value *v = o.if_contains(key);
            if (!v)
            {
                throw SafeRoute::ConfigInvalid(std::string("missing required field '") + key + "'");
            }
            return *v;
        }

        std::string TrimCopy(const std::string &s)
        {
            const std::size_t b = s.find_first_not_of(" \t\r\n");
            if (b == std::string::npos) return std::string();
            const std::size_t e = s.find_last_not_of(" \t\r\n");
            return s.substr(b, e - b + 1);
        }
    } // namespace

    std::string RequireString(const boost::json::object &o, const char *key)
    {
        const boost::json::value &v = RequireKey(o, key);
        if (!v.is_string())
        {
            throw SafeRoute::ConfigInvalid(std::string("field '") + key + "' must be a string");
        }
        return std::string(v.as_string().c_str());
    }

    int RequireInt(const boost::json::object &o, const char *key)
    {
        const boost::json::value &v = RequireKey(o, key);
        if (v.is_int64())
        {
            return static_cast<int>(v.as_int64());
        }
        if (v.is_uint64())
        {
            return static_cast<int>(v.as_uint64());
        }
        throw SafeRoute::ConfigInvalid(std::string("field '") + key + "' must be an integer");
    }

    bool RequireBool(const boost::json::object &o, const char *key)
    {
        const boost::json::value &v = RequireKey(o, key);
        if (!v.is_bool())
        {
            throw SafeRoute::ConfigInvalid(std::string("field '") + key + "' must be a boolean");
        }
        return v.as_bool();
    }

    std::optional<std::string> OptionalString(const boost::json::object &o, const char *key)
    {
        if (!o.if_contains(key) || o.at(key).is_null())
        {
            return std::nullopt;
        }
        return RequireString(o, key);
    }

    std::optional<bool> OptionalBool(const boost::json::object &o, const char *key)
    {
        if (!o.if_contains(key) || o.at(key).is_null())
        {
            return std::nullopt;
        }
        return RequireBool(o, key);
    }

    boost::json::value ParseFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            throw SafeRoute::ConfigInvalid("cannot open " + path);
        }
        std::ostringstream buf;
        buf << in.rdbuf();

        boost::json::error_code ec;
        boost::json::value jv = boost::json::parse(buf.str(), ec);
        if (ec)
        {
            throw SafeRoute::ConfigInvalid(path + ": " + ec.message());
        }
        return jv;
    }

    void WriteFileAtomic(const std::string &path, const boost::json::value &doc)
    {
        const fs::path target(path);
        if (target.has_parent_path())
        {
            fs::create_directories(target.parent_path());
        }

        const std::string tmp = path + ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                throw std::runtime_error("cannot write " + tmp);
            }
            out << boost::json::serialize(doc) << "\n";
            out.flush();
            if (!out)
            {
                throw std::runtime_error("short write to " + tmp);
            }
        }
        fs::rename(tmp, target);
        LOGT("config") << "Wrote " << path;
    }

    Settings Settings::ForDataDir(const std::string &data_dir)
    {
        Settings s;
        const fs::path root(data_dir);
        s.data_dir        = data_dir;
        s.definitions_dir = (root / "configs").string();
        s.profiles_file   = (root / "profiles.json").string();
        s.mappings_file   = (root / "devices.json").string();
        s.lock_file       = (root / "saferoute.lock").string();
        s.log_dir         = (root / "logs").string();
        return s;
    }

    Settings Settings::Defaults()
    {
        const char *env = std::getenv("SAFEROUTE_DATA_DIR");
        return ForDataDir((env && *env) ? env : "/var/lib/saferoute");
    }

    Settings LoadSettings(const std::string &path)
    {
        boost::json::value jv = ParseFile(path);
        if (!jv.is_object())
        {
            throw SafeRoute::ConfigInvalid(path + ": settings root must be an object");
        }
        const boost::json::object &o = jv.as_object();

        Settings s = Settings::Defaults();
        if (auto v = OptionalString(o, "data_dir"))
        {
            const std::string keep_well_known = s.well_known_definitions_dir;
            s = Settings::ForDataDir(*v);
            s.well_known_definitions_dir = keep_well_known;
        }
        if (auto v = OptionalString(o, "definitions_dir"))            s.definitions_dir = *v;
        if (auto v = OptionalString(o, "profiles_file"))              s.profiles_file = *v;
        if (auto v = OptionalString(o, "mappings_file"))              s.mappings_file = *v;
        if (auto v = OptionalString(o, "lock_file"))                  s.lock_file = *v;
        if (auto v = OptionalString(o, "log_dir"))                    s.log_dir = *v;
        if (auto v = OptionalString(o, "well_known_definitions_dir")) s.well_known_definitions_dir = *v;
        if (o.if_contains("resolve_timeout_ms"))
        {
            const int ms = RequireInt(o, "resolve_timeout_ms");
            if (ms <= 0)
            {
                throw SafeRoute::ConfigInvalid("'resolve_timeout_ms' must be positive");
            }
            s.resolve_timeout = std::chrono::milliseconds(ms);
        }

        LOGD("config") << "Settings: data_dir=" << s.data_dir
                       << " definitions=" << s.definitions_dir
                       << " resolve_timeout=" << s.resolve_timeout.count() << "ms";
        return s;
    }

    StartupConfig ParseStartupConfig(const boost::json::value &doc)
    {
        if (!doc.is_object())
        {
            throw SafeRoute::ConfigInvalid("startup config root must be an object");
        }
        const boost::json::object &o = doc.as_object();

        StartupConfig c;
        c.tunnel_definitions_dir = RequireString(o, "tunnel_definitions_dir");
        c.device_mappings_path   = RequireString(o, "device_mappings_path");
        c.extra_definitions_dir  = OptionalString(o, "extra_definitions_dir");
        return c;
    }

    StartupConfig LoadStartupConfig(const std::string &path)
    {
        return ParseStartupConfig(ParseFile(path));
    }

    std::vector<SafeRoute::DeviceMapping> ParseDeclaredMappings(const boost::json::value &doc)
    {
        std::vector<SafeRoute::DeviceMapping> out;
        if (!doc.is_object())
        {
            throw SafeRoute::ConfigInvalid("device mappings root must be an object");
        }
        const boost::json::value *devices = doc.as_object().if_contains("devices");
        if (!devices || devices->is_null())
        {
            return out;
        }
        if (!devices->is_array())
        {
            throw SafeRoute::ConfigInvalid("'devices' must be an array");
        }

        for (const boost::json::value &item : devices->as_array())
        {
            if (!item.is_object())
            {
                LOGW("config") << "Skipping device entry: not an object";
                continue;
            }
            const boost::json::object &d = item.as_object();
            try
            {
                SafeRoute::DeviceMapping m;
                m.ip          = TrimCopy(OptionalString(d, "ip").value_or(""));
                m.tunnel_name = TrimCopy(OptionalString(d, "tunnel").value_or(""));
                m.active      = OptionalBool(d, "active").value_or(true);
                if (auto nick = OptionalString(d, "nickname"); nick && !nick->empty())
                {
                    m.nickname = *nick;
                }
                if (m.ip.empty() || m.tunnel_name.empty())
                {
                    LOGW("config") << "Skipping device entry without ip/tunnel: " << boost::json::serialize(item);
                    continue;
                }
                out.push_back(std::move(m));
            }
            catch (const SafeRoute::ConfigInvalid &e)
            {
                LOGW("config") << "Skipping device entry: " << e.what();
            }
        }
        return out;
    }

    std::vector<SafeRoute::DeviceMapping> LoadDeclaredMappings(const std::string &path)
    {
        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            LOGW("config") << "Device mappings file not found: " << path << " (no mappings)";
            return {};
        }
        return ParseDeclaredMappings(ParseFile(path));
    }
} // namespace Config
