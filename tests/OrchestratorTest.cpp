#include "SafeRoute/Engine/Orchestrator.hpp"
#include "SafeRoute/Errors.hpp"

#include "Rig.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace SafeRoute;
using namespace SafeRoute::Test;

class OrchestratorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        defs = (rig.dir.Path() / "defs").string();
        rig.dir.Write("defs/eu.conf", Definition("10.2.0.2/32", "10.2.0.1", "198.51.100.7:51820"));
        rig.dir.Write("defs/us.conf", Definition("10.3.0.2/32", "10.3.0.1", "203.0.113.9:51820"));
        rig.dir.Write("defs/README.txt", "not a definition");
        broken = rig.dir.Write("defs/broken.conf", "[Interface]\nPrivateKey = k\nAddress = 10.9.0.2/32\n");

        cfg.tunnel_definitions_dir = defs;
        cfg.device_mappings_path   = rig.dir.Write("devices.json", R"({"devices": [
            {"ip": "192.168.1.50", "tunnel": "eu", "nickname": "laptop"},
            {"ip": "192.168.1.60", "tunnel": "us"},
            {"ip": "192.168.1.70", "tunnel": "ghost"},
            {"ip": "192.168.1.80", "tunnel": "eu", "active": false}
        ]})");
    }

    Rig                   rig;
    Orchestrator          orchestrator{rig.store, rig.tunnels, rig.routes, ""};
    Config::StartupConfig cfg;
    std::string           defs;
    std::string           broken;
};

TEST_F(OrchestratorTest, ConvergesToTheDeclaredConfig)
{
    rig.net.links["sr_gone"].kind = "wireguard";
    rig.net.rules.push_back(PolicyRule{"192.168.1.99/32", 140, RouteManager::kDeviceRulePriority});

    const StartupReport r = orchestrator.Startup(cfg);

    EXPECT_EQ(r.imported, (std::vector<std::string>{"eu", "us"}));
    EXPECT_EQ(r.import_failed, (std::vector<std::string>{broken}));
    EXPECT_EQ(r.stale_removed, (std::vector<std::string>{"sr_gone"}));
    EXPECT_EQ(r.available, (std::set<std::string>{"eu", "us"}));
    EXPECT_TRUE(r.setup_failed.empty());
    EXPECT_GE(r.flushed_rules, 1u);
    EXPECT_EQ(r.mappings_applied, (std::vector<std::string>{"192.168.1.50", "192.168.1.60"}));
    EXPECT_EQ(r.mappings_skipped, (std::vector<std::string>{"192.168.1.70", "192.168.1.80"}));

    EXPECT_TRUE(rig.net.LinkExists("sr_eu"));
    EXPECT_TRUE(rig.net.LinkExists("sr_us"));
    EXPECT_FALSE(rig.net.LinkExists("sr_gone"));
    EXPECT_TRUE(rig.net.HasRule(PolicyRule{"192.168.1.50/32", 100, RouteManager::kDeviceRulePriority}));
    EXPECT_TRUE(rig.net.HasRule(PolicyRule{"192.168.1.60/32", 101, RouteManager::kDeviceRulePriority}));
    EXPECT_EQ(rig.net.RulesFrom("192.168.1.99/32"), 0u);
    EXPECT_EQ(rig.net.RulesFrom("192.168.1.70/32"), 0u);
    EXPECT_EQ(rig.fw.From("192.168.1.50").size(), 2u);
    EXPECT_EQ(rig.routes.GetMapping("192.168.1.50")->nickname.value_or(""), "laptop");
}

TEST_F(OrchestratorTest, SecondStartupAddsNothing)
{
    orchestrator.Startup(cfg);
    const std::size_t links  = rig.net.links.size();
    const std::size_t rules  = rig.net.rules.size();
    const std::size_t routes = rig.net.routes.size();
    const std::size_t nat    = rig.fw.chain.size();

    const StartupReport again = orchestrator.Startup(cfg);

    EXPECT_TRUE(again.imported.empty());
    EXPECT_EQ(again.available.size(), 2u);
    EXPECT_EQ(rig.net.links.size(), links);
    EXPECT_EQ(rig.net.rules.size(), rules);
    EXPECT_EQ(rig.net.routes.size(), routes);
    EXPECT_EQ(rig.fw.chain.size(), nat);
    EXPECT_EQ(rig.store.List().size(), 2u);
}

TEST_F(OrchestratorTest, FailedTunnelSkipsItsDevices)
{
    rig.dir.Write("defs/asia.conf", Definition("10.4.0.2/32", "10.4.0.1", "asia.vpn.invalid:51820"));
    cfg.device_mappings_path = rig.dir.Write("devices.json", R"({"devices": [
        {"ip": "192.168.1.50", "tunnel": "eu"},
        {"ip": "192.168.1.90", "tunnel": "asia"}
    ]})");

    const StartupReport r = orchestrator.Startup(cfg);

    EXPECT_EQ(r.setup_failed, (std::vector<std::string>{"asia"}));
    EXPECT_EQ(r.available.count("asia"), 0u);
    EXPECT_EQ(r.mappings_applied, (std::vector<std::string>{"192.168.1.50"}));
    EXPECT_EQ(r.mappings_skipped, (std::vector<std::string>{"192.168.1.90"}));
    EXPECT_EQ(rig.net.RulesFrom("192.168.1.90/32"), 0u);
}

TEST_F(OrchestratorTest, ExtraAndWellKnownDirectories)
{
    rig.dir.Write("extra/jp.conf", Definition("10.5.0.2/32", "10.5.0.1"));
    rig.dir.Write("wellknown/br.conf", Definition("10.6.0.2/32", "10.6.0.1"));
    cfg.extra_definitions_dir = (rig.dir.Path() / "extra").string();

    Orchestrator with_well_known(rig.store, rig.tunnels, rig.routes,
                                 (rig.dir.Path() / "wellknown").string());
    const StartupReport r = with_well_known.Startup(cfg);

    EXPECT_EQ(r.imported, (std::vector<std::string>{"eu", "us", "jp", "br"}));
    EXPECT_TRUE(rig.store.Contains("jp"));
    EXPECT_TRUE(rig.store.Contains("br"));
}

TEST_F(OrchestratorTest, MissingDefinitionsDirectoryIsConfigInvalid)
{
    cfg.tunnel_definitions_dir = (rig.dir.Path() / "absent").string();
    EXPECT_THROW(orchestrator.Startup(cfg), ConfigInvalid);
    EXPECT_EQ(rig.net.links_created, 0u);
}

TEST_F(OrchestratorTest, MissingMappingsFileMeansNoDevices)
{
    cfg.device_mappings_path = (rig.dir.Path() / "absent.json").string();
    const StartupReport r = orchestrator.Startup(cfg);
    EXPECT_EQ(r.available.size(), 2u);
    EXPECT_TRUE(r.mappings_applied.empty());
}

TEST_F(OrchestratorTest, DeclaredInactiveClearsAPreviouslyActiveDevice)
{
    cfg.device_mappings_path = rig.dir.Write("devices.json", R"({"devices": [
        {"ip": "192.168.1.80", "tunnel": "eu"}
    ]})");
    orchestrator.Startup(cfg);
    ASSERT_EQ(rig.net.RulesFrom("192.168.1.80/32"), 1u);
    ASSERT_EQ(rig.fw.From("192.168.1.80").size(), 2u);

    cfg.device_mappings_path = rig.dir.Write("devices.json", R"({"devices": [
        {"ip": "192.168.1.80", "tunnel": "eu", "active": false, "nickname": "tv"}
    ]})");
    const StartupReport r = orchestrator.Startup(cfg);

    EXPECT_EQ(r.mappings_skipped, (std::vector<std::string>{"192.168.1.80"}));
    ASSERT_TRUE(rig.routes.GetMapping("192.168.1.80").has_value());
    EXPECT_FALSE(rig.routes.GetMapping("192.168.1.80")->active);
    EXPECT_EQ(rig.routes.GetMapping("192.168.1.80")->nickname.value_or(""), "tv");
    EXPECT_EQ(rig.net.RulesFrom("192.168.1.80/32"), 0u);
    EXPECT_TRUE(rig.fw.From("192.168.1.80").empty());
}
