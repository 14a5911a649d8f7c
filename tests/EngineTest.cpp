#include "SafeRoute/Engine/Engine.hpp"
#include "SafeRoute/Engine/EngineLock.hpp"
#include "SafeRoute/Errors.hpp"

#include "Fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <thread>

using namespace SafeRoute;
using namespace SafeRoute::Test;

class EngineTest : public ::testing::Test
{
protected:
    EngineTest()
        : settings(Config::Settings::ForDataDir(dir.Path().string()))
    {
        settings.well_known_definitions_dir.clear();
    }

    std::string Write(const std::string &name, const std::string &address, const std::string &dns,
                      const std::string &endpoint = "198.51.100.7:51820")
    {
        return dir.Write("incoming/" + name + ".conf", Definition(address, dns, endpoint));
    }

    TempDir                 dir;
    Config::Settings        settings;
    FakeNetworkControl      net;
    FakeNatFirewall         fw;
    FakeResolver            resolver;
    MemoryProfileRepository profiles;
    MemoryMappingRepository mappings;
    Engine                  engine{settings, net, fw, resolver, profiles, mappings};
};

TEST_F(EngineTest, DeleteProfileTearsDownAndDetachesDevices)
{
    engine.ImportProfile(Write("eu", "10.2.0.2/32", "10.2.0.1"), "eu");
    engine.SetupTunnel("eu");
    engine.AddMapping("192.168.1.50", "eu", true);
    ASSERT_EQ(net.RulesFrom("192.168.1.50/32"), 1u);

    engine.DeleteProfile("eu");

    EXPECT_FALSE(net.LinkExists("sr_eu"));
    EXPECT_EQ(net.RulesFrom("192.168.1.50/32"), 0u);
    EXPECT_EQ(net.RulesFrom("10.2.0.2/32"), 0u);
    EXPECT_TRUE(fw.From("192.168.1.50").empty());
    EXPECT_TRUE(engine.ListProfiles().empty());
    ASSERT_EQ(engine.ListMappings().size(), 1u);
    EXPECT_THROW(engine.DeleteProfile("eu"), NotFound);

    // the released table id and name are available again
    EXPECT_EQ(engine.ImportProfile(Write("eu", "10.2.0.2/32", "10.2.0.1"), "eu").table_id, 100u);
}

TEST_F(EngineTest, StartupPreparesTheHost)
{
    const std::string defs = (dir.Path() / "defs").string();
    dir.Write("defs/eu.conf", Definition("10.2.0.2/32", "10.2.0.1"));

    Config::StartupConfig cfg;
    cfg.tunnel_definitions_dir = defs;
    cfg.device_mappings_path   = dir.Write("devices.json",
                                           R"({"devices": [{"ip": "192.168.1.50", "tunnel": "eu"}]})");

    const StartupReport r = engine.Startup(cfg);

    EXPECT_EQ(net.sysctls["net.ipv4.ip_forward"], "1");
    EXPECT_EQ(net.sysctls["net.ipv4.conf.all.src_valid_mark"], "1");
    EXPECT_EQ(fw.forwarding_prefix, "sr_");
    EXPECT_EQ(r.mappings_applied, (std::vector<std::string>{"192.168.1.50"}));
    EXPECT_EQ(engine.TunnelStateOf("eu"), TunnelState::Up);
}

TEST_F(EngineTest, HostPreparationFailureIsNotFatal)
{
    net.failures.emplace("WriteSysctl", "*");
    const std::string defs = (dir.Path() / "defs").string();
    dir.Write("defs/eu.conf", Definition("10.2.0.2/32", "10.2.0.1"));

    Config::StartupConfig cfg;
    cfg.tunnel_definitions_dir = defs;
    cfg.device_mappings_path   = (dir.Path() / "none.json").string();

    EXPECT_EQ(engine.Startup(cfg).available.size(), 1u);
}

TEST_F(EngineTest, RepinOnlyWhenTheGatewayMoves)
{
    engine.ImportProfile(Write("eu", "10.2.0.2/32", "10.2.0.1"), "eu");
    engine.SetupTunnel("eu");
    EXPECT_TRUE(engine.RepinIfGatewayChanged());
    EXPECT_FALSE(engine.RepinIfGatewayChanged());

    net.links["wlan0"].kind = "ether";
    net.gateway = Gateway{"10.0.0.1", "wlan0", 3};
    EXPECT_TRUE(engine.RepinIfGatewayChanged());

    bool moved = false;
    for (const auto &r : net.routes)
    {
        if (r.destination == "198.51.100.7/32") moved = (r.gateway == "10.0.0.1");
    }
    EXPECT_TRUE(moved);
    EXPECT_FALSE(engine.RepinIfGatewayChanged());
}

TEST_F(EngineTest, StatusReportsTunnelsMappingsAndDns)
{
    engine.ImportProfile(Write("eu", "10.2.0.2/32", "10.2.0.1"), "eu");
    engine.ImportProfile(Write("us", "10.3.0.2/32", "10.3.0.1", "203.0.113.9:51820"), "us");
    engine.SetupTunnel("eu");
    engine.CreateMapping("192.168.1.50", "eu", true, std::string("laptop"));

    const EngineStatus st = engine.Status();

    ASSERT_EQ(st.tunnels.size(), 2u);
    EXPECT_EQ(st.tunnels[0].name, "eu");
    EXPECT_EQ(st.tunnels[0].state, TunnelState::Up);
    EXPECT_TRUE(st.tunnels[0].wireguard.has_value());
    EXPECT_EQ(st.tunnels[1].name, "us");
    EXPECT_EQ(st.tunnels[1].state, TunnelState::Absent);
    EXPECT_FALSE(st.tunnels[1].link_present);

    ASSERT_EQ(st.mappings.size(), 1u);
    EXPECT_EQ(st.mappings[0].nickname.value_or(""), "laptop");
    ASSERT_EQ(st.dns.count("192.168.1.50"), 1u);
    EXPECT_EQ(st.dns.at("192.168.1.50").size(), 2u);
    EXPECT_EQ(engine.DnsRulesFor("192.168.1.50").size(), 2u);

    fw.fail_list = true;
    EXPECT_TRUE(engine.Status().dns.empty());
}

TEST(EngineLock, SerialisesThreadsAndCreatesTheLockFile)
{
    TempDir dir;
    const std::string file = (dir.Path() / "run" / "saferoute.lock").string();
    EngineLock lock(file);

    int counter = 0;
    auto work = [&]
    {
        for (int i = 0; i < 200; ++i)
        {
            auto scope = lock.Acquire();
            const int seen = counter;
            std::this_thread::yield();
            counter = seen + 1;
        }
    };
    std::thread a(work);
    std::thread b(work);
    a.join();
    b.join();

    EXPECT_EQ(counter, 400);
    EXPECT_TRUE(std::filesystem::exists(file));
}
