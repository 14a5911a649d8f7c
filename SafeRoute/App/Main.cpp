// Main.cpp — saferoute CLI: тонкая обёртка над Engine, вывод в JSON.
// Логи идут в stderr и файл, результат команды в stdout.

#include "SafeRoute/Config.hpp"
#include "SafeRoute/Engine/Engine.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Kernel/NetlinkControl.hpp"
#include "SafeRoute/Kernel/NftFirewall.hpp"
#include "SafeRoute/Kernel/Resolver.hpp"
#include "SafeRoute/Logger.hpp"
#include "SafeRoute/Store/JsonRepository.hpp"

#include <boost/json.hpp>

#include <getopt.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    constexpr const char *kUsage =
        "Usage: saferoute [--settings FILE] [--verbose] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  startup CONFIG                      converge to a declared config\n"
        "  run                                 set up everything, watch routes until SIGINT/SIGTERM\n"
        "  import FILE NAME                    import a WireGuard definition\n"
        "  delete NAME                         tear down and forget a profile\n"
        "  setup NAME | teardown NAME          bring one tunnel up / down\n"
        "  map IP TUNNEL [--inactive] [--nickname N]\n"
        "  update IP [--tunnel T] [--active true|false] [--nickname N]\n"
        "  unmap IP\n"
        "  list                                profiles and mappings\n"
        "  sync                                rebuild device rules\n"
        "  status                              tunnels, mappings, DNS redirects\n"
        "  dns [IP]                            live DNS redirect rules\n";

    class UsageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    int ExitCodeFor(SafeRoute::ErrorKind kind)
    {
        switch (kind)
        {
            case SafeRoute::ErrorKind::ConfigInvalid:        return 2;
            case SafeRoute::ErrorKind::Conflict:             return 3;
            case SafeRoute::ErrorKind::NotFound:             return 4;
            case SafeRoute::ErrorKind::ResolutionError:      return 5;
            case SafeRoute::ErrorKind::KernelOperationError: return 6;
        }
        return 1;
    }

    void Print(const boost::json::value &v)
    {
        std::cout << boost::json::serialize(v) << std::endl;
    }

    boost::json::array Strings(const std::vector<std::string> &v)
    {
        boost::json::array a;
        for (const auto &s : v) a.emplace_back(s);
        return a;
    }

    boost::json::object ProfileJson(const SafeRoute::TunnelProfile &p)
    {
        boost::json::object o = SafeRoute::ProfileToJson(p);
        o["name"] = p.name;
        return o;
    }

    boost::json::object RuleJson(const SafeRoute::NatRule &r)
    {
        return boost::json::object{
            {"position", r.position},
            {"handle",   r.handle},
            {"source",   r.source},
            {"protocol", r.protocol},
            {"dport",    r.dport},
            {"to",       r.to_address + ":" + std::to_string(r.to_port)},
            {"comment",  r.comment},
        };
    }

    boost::json::object DnsJson(const std::map<std::string, std::vector<SafeRoute::NatRule>> &dns)
    {
        boost::json::object o;
        for (const auto &kv : dns)
        {
            boost::json::array rules;
            for (const auto &r : kv.second) rules.push_back(RuleJson(r));
            o[kv.first] = std::move(rules);
        }
        return o;
    }

    boost::json::array MappingsJson(const std::vector<SafeRoute::DeviceMapping> &mappings)
    {
        boost::json::array a;
        for (const auto &m : mappings) a.push_back(SafeRoute::MappingToJson(m));
        return a;
    }

    boost::json::object TunnelJson(const SafeRoute::TunnelStatus &st)
    {
        boost::json::object o{
            {"name",         st.name},
            {"interface",    st.interface_name},
            {"table_id",     st.table_id},
            {"state",        SafeRoute::ToString(st.state)},
            {"link_present", st.link_present},
        };
        if (st.wireguard)
        {
            const auto &wg = *st.wireguard;
            boost::json::object peer{
                {"public_key", wg.peer_public_key},
                {"endpoint",   wg.peer_endpoint},
                {"rx_bytes",   wg.rx_bytes},
                {"tx_bytes",   wg.tx_bytes},
            };
            if (wg.last_handshake_unix > 0)
            {
                peer["last_handshake"]     = wg.last_handshake_unix;
                peer["handshake_age_sec"]  = static_cast<std::int64_t>(std::time(nullptr)) - wg.last_handshake_unix;
            }
            else
            {
                peer["last_handshake"] = nullptr;
            }
            o["wireguard"] = std::move(peer);
        }
        return o;
    }

    boost::json::object SyncJson(const SafeRoute::SyncReport &r)
    {
        return boost::json::object{{"applied", r.applied}, {"cleared", r.cleared}, {"failed", r.failed}};
    }

    bool ParseBool(const std::string &s)
    {
        if (s == "true" || s == "1" || s == "yes")  return true;
        if (s == "false" || s == "0" || s == "no")  return false;
        throw UsageError("expected true|false, got '" + s + "'");
    }

    struct CommandArgs
    {
        std::vector<std::string>   positional;
        bool                       inactive = false;
        std::optional<std::string> tunnel;
        std::optional<bool>        active;
        std::optional<std::string> nickname;
    };

    // argv[0] — имя команды; getopt_long перезапускается через optind = 0
    CommandArgs ParseCommandArgs(int argc, char **argv)
    {
        enum { kInactive = 1000, kTunnel, kActive, kNickname };
        const option opts[] = {
            {"inactive", no_argument,       nullptr, kInactive},
            {"tunnel",   required_argument, nullptr, kTunnel},
            {"active",   required_argument, nullptr, kActive},
            {"nickname", required_argument, nullptr, kNickname},
            {nullptr,    0,                 nullptr, 0},
        };

        CommandArgs args;
        optind = 0;
        while (true)
        {
            const int opt = ::getopt_long(argc, argv, "", opts, nullptr);
            if (opt == -1) break;

            switch (opt)
            {
                case kInactive: args.inactive = true;             break;
                case kTunnel:   args.tunnel   = std::string(optarg); break;
                case kActive:   args.active   = ParseBool(optarg);  break;
                case kNickname: args.nickname = std::string(optarg); break;
                default:
                    throw UsageError(std::string("bad option for '") + argv[0] + "'");
            }
        }
        for (int i = optind; i < argc; ++i)
        {
            args.positional.emplace_back(argv[i]);
        }
        return args;
    }

    void Expect(const CommandArgs &args, std::size_t min, std::size_t max, const std::string &cmd)
    {
        if (args.positional.size() < min || args.positional.size() > max)
        {
            throw UsageError("wrong number of arguments for '" + cmd + "'");
        }
    }

    /// SIGINT/SIGTERM блокируются до создания потоков, затем ждём sigwait'ом.
    sigset_t BlockStopSignals()
    {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
        return set;
    }

    int RunCommand(SafeRoute::Engine &engine, const std::string &cmd, const CommandArgs &args,
                   const sigset_t &stop_signals)
    {
        using namespace SafeRoute;

        if (cmd == "startup")
        {
            Expect(args, 1, 1, cmd);
            const StartupReport r = engine.Startup(Config::LoadStartupConfig(args.positional[0]));
            boost::json::array available;
            for (const auto &n : r.available) available.emplace_back(n);
            Print(boost::json::object{
                {"imported",         Strings(r.imported)},
                {"import_failed",    Strings(r.import_failed)},
                {"stale_removed",    Strings(r.stale_removed)},
                {"available",        std::move(available)},
                {"setup_failed",     Strings(r.setup_failed)},
                {"flushed_rules",    r.flushed_rules},
                {"mappings_applied", Strings(r.mappings_applied)},
                {"mappings_skipped", Strings(r.mappings_skipped)},
                {"sync",             SyncJson(r.sync)},
            });
            return 0;
        }
        if (cmd == "run")
        {
            Expect(args, 0, 0, cmd);
            const DaemonReport r = engine.Run([&stop_signals]
            {
                int sig = 0;
                sigwait(&stop_signals, &sig);
                LOGI("app") << "Signal " << sig << ", stopping";
            });
            Print(boost::json::object{
                {"up",     Strings(r.up)},
                {"failed", Strings(r.failed)},
                {"sync",   SyncJson(r.sync)},
            });
            return 0;
        }
        if (cmd == "import")
        {
            Expect(args, 2, 2, cmd);
            Print(ProfileJson(engine.ImportProfile(args.positional[0], args.positional[1])));
            return 0;
        }
        if (cmd == "delete")
        {
            Expect(args, 1, 1, cmd);
            engine.DeleteProfile(args.positional[0]);
            Print(boost::json::object{{"deleted", args.positional[0]}});
            return 0;
        }
        if (cmd == "setup")
        {
            Expect(args, 1, 1, cmd);
            engine.SetupTunnel(args.positional[0]);
            Print(boost::json::object{{"name", args.positional[0]},
                                      {"state", ToString(engine.TunnelStateOf(args.positional[0]))}});
            return 0;
        }
        if (cmd == "teardown")
        {
            Expect(args, 1, 1, cmd);
            const Outcome o = engine.TeardownTunnel(args.positional[0]);
            Print(boost::json::object{{"name", args.positional[0]}, {"result", ToString(o.result)}});
            return o.Ok() ? 0 : ExitCodeFor(ErrorKind::KernelOperationError);
        }
        if (cmd == "map")
        {
            Expect(args, 2, 2, cmd);
            engine.AddMapping(args.positional[0], args.positional[1], !args.inactive, args.nickname);
            Print(MappingsJson(engine.ListMappings()));
            return 0;
        }
        if (cmd == "update")
        {
            Expect(args, 1, 1, cmd);
            engine.UpdateMapping(args.positional[0], args.tunnel, args.active, args.nickname);
            Print(MappingsJson(engine.ListMappings()));
            return 0;
        }
        if (cmd == "unmap")
        {
            Expect(args, 1, 1, cmd);
            engine.RemoveMapping(args.positional[0]);
            Print(MappingsJson(engine.ListMappings()));
            return 0;
        }
        if (cmd == "list")
        {
            Expect(args, 0, 0, cmd);
            boost::json::array profiles;
            for (const auto &p : engine.ListProfiles()) profiles.push_back(ProfileJson(p));
            Print(boost::json::object{{"profiles", std::move(profiles)},
                                      {"mappings", MappingsJson(engine.ListMappings())}});
            return 0;
        }
        if (cmd == "sync")
        {
            Expect(args, 0, 0, cmd);
            Print(SyncJson(engine.SyncRules()));
            return 0;
        }
        if (cmd == "status")
        {
            Expect(args, 0, 0, cmd);
            const EngineStatus st = engine.Status();
            boost::json::array tunnels;
            for (const auto &t : st.tunnels) tunnels.push_back(TunnelJson(t));
            Print(boost::json::object{{"tunnels",  std::move(tunnels)},
                                      {"mappings", MappingsJson(st.mappings)},
                                      {"dns",      DnsJson(st.dns)}});
            return 0;
        }
        if (cmd == "dns")
        {
            Expect(args, 0, 1, cmd);
            if (args.positional.empty())
            {
                Print(DnsJson(engine.DnsRules()));
            }
            else
            {
                boost::json::array rules;
                for (const auto &r : engine.DnsRulesFor(args.positional[0])) rules.push_back(RuleJson(r));
                Print(rules);
            }
            return 0;
        }
        throw UsageError("unknown command '" + cmd + "'");
    }
} // namespace

int main(int argc, char **argv)
{
    const sigset_t stop_signals = BlockStopSignals();

    const option opts[] = {
        {"settings", required_argument, nullptr, 's'},
        {"verbose",  no_argument,       nullptr, 'v'},
        {"help",     no_argument,       nullptr, 'h'},
        {nullptr,    0,                 nullptr, 0},
    };

    std::optional<std::string> settings_path;
    bool verbose = false;

    // '+': разбор останавливается на имени команды
    while (true)
    {
        const int opt = ::getopt_long(argc, argv, "+s:vh", opts, nullptr);
        if (opt == -1) break;

        switch (opt)
        {
            case 's': settings_path = std::string(optarg); break;
            case 'v': verbose = true;                      break;
            case 'h': std::cout << kUsage; return 0;
            default:  std::cerr << kUsage; return 1;
        }
    }
    if (optind >= argc)
    {
        std::cerr << kUsage;
        return 1;
    }

    const std::string cmd = argv[optind];
    const int cmd_argc    = argc - optind;
    char    **cmd_argv    = argv + optind;

    Config::Settings settings;
    try
    {
        settings = settings_path ? Config::LoadSettings(*settings_path) : Config::Settings::Defaults();
    }
    catch (const SafeRoute::Error &e)
    {
        std::cerr << "settings: " << e.what() << std::endl;
        return ExitCodeFor(e.Kind());
    }

    Logger::Options log_opts;
    log_opts.directory            = settings.log_dir;
    log_opts.console_min_severity = verbose ? boost::log::trivial::debug : boost::log::trivial::warning;
    log_opts.file_min_severity    = boost::log::trivial::info;
    log_opts.enable_file          = (::geteuid() == 0);

    Logger::Guard lg(log_opts);
    LOGD("app") << "saferoute " << cmd << " (data " << settings.data_dir << ")";

    try
    {
        const CommandArgs args = ParseCommandArgs(cmd_argc, cmd_argv);

        SafeRoute::NetlinkControl        net;
        SafeRoute::NftFirewall           fw;
        SafeRoute::SystemResolver        resolver(settings.resolve_timeout);
        SafeRoute::JsonProfileRepository profiles(settings.profiles_file, settings.definitions_dir);
        SafeRoute::JsonMappingRepository mappings(settings.mappings_file);

        SafeRoute::Engine engine(settings, net, fw, resolver, profiles, mappings);
        return RunCommand(engine, cmd, args, stop_signals);
    }
    catch (const UsageError &e)
    {
        std::cerr << e.what() << "\n\n" << kUsage;
        return 1;
    }
    catch (const SafeRoute::Error &e)
    {
        LOGE("app") << cmd << ": " << SafeRoute::ToString(e.Kind()) << ": " << e.what();
        Print(boost::json::object{{"error", SafeRoute::ToString(e.Kind())}, {"message", e.what()}});
        return ExitCodeFor(e.Kind());
    }
    catch (const std::exception &e)
    {
        LOGE("app") << cmd << ": " << e.what();
        Print(boost::json::object{{"error", "internal"}, {"message", e.what()}});
        return 1;
    }
}
