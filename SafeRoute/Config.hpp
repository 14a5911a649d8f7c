#pragma once

// Config.hpp — JSON-конфиги (Boost.JSON): настройки движка, декларативный
// startup-конфиг и список маппингов устройств.

#include "SafeRoute/Store/Records.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace Config
{
    // ---- field helpers: throw SafeRoute::ConfigInvalid naming the key ----
    std::string RequireString(const boost::json::object &o, const char *key);
    int         RequireInt(const boost::json::object &o, const char *key);
    bool        RequireBool(const boost::json::object &o, const char *key);

    std::optional<std::string> OptionalString(const boost::json::object &o, const char *key);
    std::optional<bool>        OptionalBool(const boost::json::object &o, const char *key);

    /// Parse a whole file as JSON; unreadable file or syntax error => ConfigInvalid.
    boost::json::value ParseFile(const std::string &path);

    /// Write a JSON document to path atomically (temp file + rename).
    void WriteFileAtomic(const std::string &path, const boost::json::value &doc);

    /**
     * @brief Engine settings. Paths are derived from data_dir unless a
     *        settings file overrides them.
     */
    struct Settings
    {
        std::string data_dir;
        std::string definitions_dir;             ///< managed copies of imported definitions
        std::string profiles_file;
        std::string mappings_file;
        std::string lock_file;
        std::string log_dir;
        std::string well_known_definitions_dir = "/etc/saferoute/wireguard";
        std::chrono::milliseconds resolve_timeout{5000};

        /// Defaults rooted at $SAFEROUTE_DATA_DIR or /var/lib/saferoute.
        static Settings Defaults();

        /// Defaults with every path derived from data_dir.
        static Settings ForDataDir(const std::string &data_dir);
    };

    /// Defaults overlaid with the keys present in a JSON settings file.
    Settings LoadSettings(const std::string &path);

    /// Declared startup configuration.
    struct StartupConfig
    {
        std::string                tunnel_definitions_dir;
        std::string                device_mappings_path;
        std::optional<std::string> extra_definitions_dir;
    };

    StartupConfig LoadStartupConfig(const std::string &path);
    StartupConfig ParseStartupConfig(const boost::json::value &doc);

    /**
     * @brief Load the declared device-mapping record.
     *        Missing file => empty list; malformed entries are skipped.
     */
    std::vector<SafeRoute::DeviceMapping> LoadDeclaredMappings(const std::string &path);
    std::vector<SafeRoute::DeviceMapping> ParseDeclaredMappings(const boost::json::value &doc);
} // namespace Config
