#include "SafeRoute/Engine/TunnelManager.hpp"
#include "SafeRoute/Errors.hpp"

#include "Rig.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace SafeRoute;
using namespace SafeRoute::Test;

namespace
{
    const RouteSpec *FindRoute(const FakeNetworkControl &net, const std::string &dst, std::uint32_t table)
    {
        for (const auto &r : net.routes)
        {
            if (r.destination == dst && r.table == table) return &r;
        }
        return nullptr;
    }
}

TEST(TunnelManager, SetupBuildsTheWholeTunnel)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1");
    rig.tunnels.Setup("eu");

    ASSERT_TRUE(rig.net.LinkExists("sr_eu"));
    const auto &link = rig.net.links.at("sr_eu");
    EXPECT_EQ(link.kind, "wireguard");
    EXPECT_EQ(link.addresses, (std::vector<std::string>{"10.2.0.2/32"}));
    EXPECT_EQ(link.mtu, TunnelManager::kMtu);
    EXPECT_TRUE(link.up);
    EXPECT_EQ(link.private_key, "yAnz5TF+lXXJte14tji3zlMNq+hd2rYUIgJBgB3fBmk=");
    ASSERT_TRUE(link.peer.has_value());
    EXPECT_EQ(link.peer->public_key, "xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=");
    EXPECT_EQ(link.peer->endpoint_address, "198.51.100.7");
    EXPECT_EQ(link.peer->endpoint_port, 51820);
    EXPECT_EQ(link.peer->keepalive_seconds, 25);
    EXPECT_EQ(link.peer->allowed_ips, (std::vector<std::string>{"0.0.0.0/0"}));

    const RouteSpec *pin = FindRoute(rig.net, "198.51.100.7/32", kMainTable);
    ASSERT_NE(pin, nullptr);
    EXPECT_EQ(pin->gateway, "192.168.1.1");
    EXPECT_EQ(pin->interface_name, "eth0");

    const RouteSpec *def = FindRoute(rig.net, "0.0.0.0/0", 100);
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->interface_name, "sr_eu");

    EXPECT_TRUE(rig.net.HasRule(PolicyRule{"10.2.0.2/32", 100, TunnelManager::kSelfRulePriority}));
    EXPECT_EQ(rig.tunnels.State("eu"), TunnelState::Up);
}

TEST(TunnelManager, SetupIsIdempotent)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1");
    rig.tunnels.Setup("eu");
    const std::size_t rules  = rig.net.rules.size();
    const std::size_t routes = rig.net.routes.size();
    const std::size_t links  = rig.net.links.size();

    rig.tunnels.Setup("eu");

    EXPECT_EQ(rig.net.rules.size(), rules);
    EXPECT_EQ(rig.net.routes.size(), routes);
    EXPECT_EQ(rig.net.links.size(), links);
    EXPECT_EQ(rig.net.links_created, 2u);
    EXPECT_EQ(rig.tunnels.State("eu"), TunnelState::Up);
}

TEST(TunnelManager, InterfaceFailureIsFatal)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1");
    rig.net.failures.emplace("CreateLink", "sr_eu");

    EXPECT_THROW(rig.tunnels.Setup("eu"), KernelOperationError);
    EXPECT_FALSE(rig.net.LinkExists("sr_eu"));
    EXPECT_EQ(rig.tunnels.State("eu"), TunnelState::Absent);
}

TEST(TunnelManager, KeyProgrammingFailureRemovesTheLink)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1");
    rig.net.failures.emplace("ConfigureWireGuard", "sr_eu");

    EXPECT_THROW(rig.tunnels.Setup("eu"), KernelOperationError);
    EXPECT_FALSE(rig.net.LinkExists("sr_eu"));
    EXPECT_EQ(rig.tunnels.State("eu"), TunnelState::Absent);
    EXPECT_EQ(rig.net.RulesFrom("10.2.0.2/32"), 0u);
}

TEST(TunnelManager, RoutingStepsAreBestEffort)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1");
    rig.net.failures.emplace("AddRoute", "0.0.0.0/0");
    rig.net.failures.emplace("AddRule", "10.2.0.2/32");
    rig.net.gateway.reset();

    EXPECT_NO_THROW(rig.tunnels.Setup("eu"));
    EXPECT_EQ(rig.tunnels.State("eu"), TunnelState::Up);
    EXPECT_TRUE(rig.net.LinkExists("sr_eu"));
    EXPECT_EQ(FindRoute(rig.net, "198.51.100.7/32", kMainTable), nullptr);
}

TEST(TunnelManager, EndpointHostnameIsResolved)
{
    Rig rig;
    rig.resolver.names["eu.vpn.example"] = "198.51.100.7";
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1", "eu.vpn.example:51820");
    rig.tunnels.Setup("eu");

    EXPECT_EQ(rig.net.links.at("sr_eu").peer->endpoint_address, "198.51.100.7");
    EXPECT_NE(FindRoute(rig.net, "198.51.100.7/32", kMainTable), nullptr);
}

TEST(TunnelManager, UnresolvableEndpointCreatesNothing)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1", "vpn.invalid:51820");

    EXPECT_THROW(rig.tunnels.Setup("eu"), ResolutionError);
    EXPECT_FALSE(rig.net.LinkExists("sr_eu"));
    EXPECT_EQ(rig.net.links_created, 0u);
}

TEST(TunnelManager, TeardownRemovesEverythingAndIsRepeatable)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1");
    rig.tunnels.Setup("eu");

    EXPECT_EQ(rig.tunnels.Teardown("eu").result, OpResult::Applied);
    EXPECT_FALSE(rig.net.LinkExists("sr_eu"));
    EXPECT_EQ(rig.net.RulesFrom("10.2.0.2/32"), 0u);
    EXPECT_EQ(FindRoute(rig.net, "198.51.100.7/32", kMainTable), nullptr);
    EXPECT_EQ(FindRoute(rig.net, "0.0.0.0/0", 100), nullptr);
    EXPECT_EQ(rig.tunnels.State("eu"), TunnelState::Absent);

    EXPECT_EQ(rig.tunnels.Teardown("eu").result, OpResult::Unchanged);
    EXPECT_THROW(rig.tunnels.Teardown("nope"), NotFound);
}

TEST(TunnelManager, SharedEndpointRouteSurvivesOneTeardown)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1", "198.51.100.7:51820");
    rig.Import("eu2", "10.2.1.2/32", "10.2.0.1", "198.51.100.7:51821");
    rig.tunnels.Setup("eu");
    rig.tunnels.Setup("eu2");

    rig.tunnels.Teardown("eu");
    EXPECT_NE(FindRoute(rig.net, "198.51.100.7/32", kMainTable), nullptr);

    rig.tunnels.Teardown("eu2");
    EXPECT_EQ(FindRoute(rig.net, "198.51.100.7/32", kMainTable), nullptr);
}

TEST(TunnelManager, StaleInterfacesAreRemoved)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1");
    rig.tunnels.Setup("eu");
    rig.net.links["sr_old"].kind = "wireguard";
    rig.net.links["wg0"].kind    = "wireguard";

    const auto removed = rig.tunnels.CleanupStaleTunnels();

    EXPECT_EQ(removed, (std::vector<std::string>{"sr_old"}));
    EXPECT_TRUE(rig.net.LinkExists("sr_eu"));
    EXPECT_TRUE(rig.net.LinkExists("wg0"));
    EXPECT_TRUE(rig.net.LinkExists("eth0"));
}

TEST(TunnelManager, UntouchedProfilesReportLinkPresence)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1");
    rig.Import("us", "10.3.0.2/32", "10.3.0.1");
    rig.tunnels.Setup("eu");

    TunnelManager other(rig.store, rig.net, rig.resolver);
    EXPECT_EQ(other.State("eu"), TunnelState::Up);
    EXPECT_EQ(other.State("us"), TunnelState::Absent);
    EXPECT_THROW(other.State("nope"), NotFound);

    const TunnelStatus st = other.Status(rig.store.Require("eu"));
    EXPECT_TRUE(st.link_present);
    ASSERT_TRUE(st.wireguard.has_value());
    EXPECT_EQ(st.wireguard->peer_endpoint, "198.51.100.7:51820");
}

TEST(TunnelManager, RepinFollowsTheGateway)
{
    Rig rig;
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1");
    rig.tunnels.Setup("eu");

    rig.net.links["wlan0"].kind = "ether";
    rig.net.gateway = Gateway{"10.0.0.1", "wlan0", 3};
    rig.tunnels.RepinEndpoints();

    const RouteSpec *pin = FindRoute(rig.net, "198.51.100.7/32", kMainTable);
    ASSERT_NE(pin, nullptr);
    EXPECT_EQ(pin->gateway, "10.0.0.1");
    EXPECT_EQ(pin->interface_name, "wlan0");
    EXPECT_EQ(std::count_if(rig.net.routes.begin(), rig.net.routes.end(),
                            [](const RouteSpec &r) { return r.destination == "198.51.100.7/32"; }),
              1);
}

TEST(TunnelManager, PinIsRemovedByALaterProcess)
{
    Rig rig;
    rig.resolver.names["vpn.example"] = "198.51.100.7";
    rig.Import("eu", "10.2.0.2/32", "10.2.0.1", "vpn.example:51820");
    rig.tunnels.Setup("eu");
    const std::size_t routes = rig.net.routes.size();
    ASSERT_TRUE(rig.profile_repo.saved.at("eu").pin.has_value());
    EXPECT_EQ(rig.profile_repo.saved.at("eu").pin->destination, "198.51.100.7/32");

    auto pins = [&rig]
    {
        return std::count_if(rig.net.routes.begin(), rig.net.routes.end(), [](const RouteSpec &r)
                             { return r.table == kMainTable && r.destination.rfind("198.51.100.", 0) == 0; });
    };

    // the name now points elsewhere; a new process sets the tunnel up again
    rig.resolver.names["vpn.example"] = "198.51.100.8";
    {
        ProfileStore  store(rig.profile_repo);
        TunnelManager tunnels(store, rig.net, rig.resolver);
        tunnels.Setup("eu");
    }
    EXPECT_EQ(rig.net.routes.size(), routes);
    EXPECT_EQ(pins(), 1);
    EXPECT_NE(FindRoute(rig.net, "198.51.100.8/32", kMainTable), nullptr);

    {
        ProfileStore  store(rig.profile_repo);
        TunnelManager tunnels(store, rig.net, rig.resolver);
        tunnels.Teardown("eu");
    }
    EXPECT_EQ(pins(), 0);
    EXPECT_FALSE(rig.profile_repo.saved.at("eu").pin.has_value());
}
