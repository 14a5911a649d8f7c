#include "SafeRoute/Engine/Orchestrator.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace SafeRoute
{
    Orchestrator::Orchestrator(ProfileStore  &store,
                               TunnelManager &tunnels,
                               RouteManager  &routes,
                               std::string    well_known_definitions_dir)
        : store_(store)
        , tunnels_(tunnels)
        , routes_(routes)
        , well_known_dir_(std::move(well_known_definitions_dir))
    {
    }

    void Orchestrator::ImportDirectory_(const std::string &dir, StartupReport &report)
    {
        std::error_code ec;
        std::vector<fs::path> files;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        {
            if (it->is_regular_file(ec) && it->path().extension() == ".conf")
            {
                files.push_back(it->path());
            }
        }
        if (ec)
        {
            LOGW("orchestrator") << "Scan " << dir << " failed: " << ec.message();
        }
        std::sort(files.begin(), files.end());

        for (const auto &path : files)
        {
            const std::string name = path.stem().string();
            if (store_.Contains(name))
            {
                LOGT("orchestrator") << "Profile " << name << " already known";
                continue;
            }
            try
            {
                store_.Import(path.string(), name);
                report.imported.push_back(name);
            }
            catch (const std::exception &e)
            {
                LOGW("orchestrator") << "Import " << path.string() << " failed: " << e.what();
                report.import_failed.push_back(path.string());
            }
        }
    }

    StartupReport Orchestrator::Startup(const Config::StartupConfig &cfg)
    {
        StartupReport report;
        LOGI("orchestrator") << "Startup: definitions=" << cfg.tunnel_definitions_dir
                             << " mappings=" << cfg.device_mappings_path;

        // 1) объявленный каталог обязателен
        std::error_code ec;
        if (!fs::is_directory(cfg.tunnel_definitions_dir, ec))
        {
            throw ConfigInvalid("tunnel definitions directory not found: " + cfg.tunnel_definitions_dir);
        }

        // 2) discover + import
        std::vector<std::string> dirs{cfg.tunnel_definitions_dir};
        if (cfg.extra_definitions_dir)
        {
            dirs.push_back(*cfg.extra_definitions_dir);
        }
        if (!well_known_dir_.empty() && fs::is_directory(well_known_dir_, ec))
        {
            dirs.push_back(well_known_dir_);
        }
        for (const auto &dir : dirs)
        {
            ImportDirectory_(dir, report);
        }

        // 3) declared mappings (missing file: none)
        const auto declared = Config::LoadDeclaredMappings(cfg.device_mappings_path);
        LOGD("orchestrator") << "Declared mappings: " << declared.size();

        // 4) orphans of a previous run
        report.stale_removed = tunnels_.CleanupStaleTunnels();

        // 5) tunnels
        for (const auto &profile : store_.List())
        {
            try
            {
                tunnels_.Setup(profile.name);
                report.available.insert(profile.name);
            }
            catch (const Error &e)
            {
                LOGW("orchestrator") << "Setup " << profile.name << " failed ("
                                     << ToString(e.Kind()) << "): " << e.what();
                report.setup_failed.push_back(profile.name);
            }
        }

        // 6) device rules from scratch
        report.flushed_rules = routes_.FlushAllDeviceRules();
        for (const auto &m : declared)
        {
            if (!m.active && store_.Contains(m.tunnel_name))
            {
                // записать неактивность: шаг 7 снимет правило и DNS
                try
                {
                    routes_.AddMapping(m.ip, m.tunnel_name, false, m.nickname);
                }
                catch (const Error &e)
                {
                    LOGW("orchestrator") << "Mapping " << m.ip << " -> " << m.tunnel_name
                                         << " (inactive) failed: " << e.what();
                }
            }
            if (!m.active || !report.available.count(m.tunnel_name))
            {
                LOGI("orchestrator") << "Mapping " << m.ip << " -> " << m.tunnel_name << " skipped ("
                                     << (m.active ? "tunnel unavailable" : "inactive") << ")";
                report.mappings_skipped.push_back(m.ip);
                continue;
            }
            try
            {
                routes_.AddMapping(m.ip, m.tunnel_name, true, m.nickname);
                report.mappings_applied.push_back(m.ip);
            }
            catch (const Error &e)
            {
                LOGW("orchestrator") << "Mapping " << m.ip << " -> " << m.tunnel_name << " failed: " << e.what();
                report.mappings_skipped.push_back(m.ip);
            }
        }

        // 7) final convergence pass
        report.sync = routes_.SyncRules();

        LOGI("orchestrator") << "Startup done: imported=" << report.imported.size()
                             << " available=" << report.available.size()
                             << " failed=" << report.setup_failed.size()
                             << " mapped=" << report.mappings_applied.size()
                             << " skipped=" << report.mappings_skipped.size();
        return report;
    }
} // namespace SafeRoute
