#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Store/TunnelDefinition.hpp"

#include <gtest/gtest.h>

using namespace SafeRoute;

namespace
{
    constexpr const char *kFull =
        "# exported by the provider\n"
        "[Interface]\n"
        "PrivateKey = yAnz5TF+lXXJte14tji3zlMNq+hd2rYUIgJBgB3fBmk=\n"
        "Address = 10.2.0.2/32, fd00::2/128\n"
        "DNS = 10.2.0.1, 1.1.1.1, corp.example\n"
        "\n"
        "[Peer]\n"
        "; main exit\n"
        "PublicKey = xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=\n"
        "Endpoint = eu.vpn.example:51820\n"
        "AllowedIPs = 0.0.0.0/0, ::/0\n"
        "\n"
        "[Peer]\n"
        "PublicKey = TrMvSoP4jYQlY6RIzBgbssQqY3vxI2Pi+y71lOWWXX0=\n"
        "Endpoint = 203.0.113.9:51820\n";
}

TEST(TunnelDefinition, ParsesInterfaceAndFirstPeer)
{
    const TunnelDefinition def = ParseTunnelDefinition(kFull, "eu.conf");

    EXPECT_EQ(def.private_key, "yAnz5TF+lXXJte14tji3zlMNq+hd2rYUIgJBgB3fBmk=");
    EXPECT_EQ(def.local_address, "10.2.0.2/32");
    EXPECT_EQ(def.dns_servers, (std::vector<std::string>{"10.2.0.1", "1.1.1.1"}));
    EXPECT_EQ(def.peer_public_key, "xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=");
    EXPECT_EQ(def.endpoint_host, "eu.vpn.example");
    EXPECT_EQ(def.endpoint_port, 51820);
    EXPECT_EQ(def.allowed_ips, (std::vector<std::string>{"0.0.0.0/0", "::/0"}));
}

TEST(TunnelDefinition, MissingPeerIsConfigInvalid)
{
    const std::string text =
        "[Interface]\n"
        "PrivateKey = yAnz5TF+lXXJte14tji3zlMNq+hd2rYUIgJBgB3fBmk=\n"
        "Address = 10.2.0.2/32\n";
    EXPECT_THROW(ParseTunnelDefinition(text, "nopeer.conf"), ConfigInvalid);
}

TEST(TunnelDefinition, MissingInterfaceIsConfigInvalid)
{
    const std::string text =
        "[Peer]\n"
        "PublicKey = xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=\n"
        "Endpoint = 198.51.100.7:51820\n";
    EXPECT_THROW(ParseTunnelDefinition(text, "noif.conf"), ConfigInvalid);
}

TEST(TunnelDefinition, RequiredKeys)
{
    const std::string no_key =
        "[Interface]\nAddress = 10.2.0.2/32\n[Peer]\n"
        "PublicKey = xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=\nEndpoint = 198.51.100.7:51820\n";
    EXPECT_THROW(ParseTunnelDefinition(no_key, "a.conf"), ConfigInvalid);

    const std::string no_endpoint =
        "[Interface]\nPrivateKey = k\nAddress = 10.2.0.2/32\n[Peer]\n"
        "PublicKey = xTIBA5rboUvnH4htodjb6e697QjLERt1NAB4mZqp8Dg=\n";
    EXPECT_THROW(ParseTunnelDefinition(no_endpoint, "b.conf"), ConfigInvalid);
}

TEST(TunnelDefinition, AllowedIpsDefaultAndHostPrefix)
{
    const std::string text =
        "[Interface]\nPrivateKey = k\nAddress = 10.3.0.2\n[Peer]\n"
        "PublicKey = p\nEndpoint = 198.51.100.7:51820\n";
    const TunnelDefinition def = ParseTunnelDefinition(text, "us.conf");
    EXPECT_EQ(def.local_address, "10.3.0.2/32");
    EXPECT_EQ(def.allowed_ips, (std::vector<std::string>{"0.0.0.0/0"}));
    EXPECT_TRUE(def.dns_servers.empty());
}

TEST(TunnelDefinition, MalformedLine)
{
    const std::string text = "[Interface]\nPrivateKey k\n";
    EXPECT_THROW(ParseTunnelDefinition(text, "bad.conf"), ConfigInvalid);
}

TEST(TunnelDefinition, SplitEndpoint)
{
    EXPECT_EQ(SplitEndpoint("vpn.example:51820"), (std::pair<std::string, std::uint16_t>{"vpn.example", 51820}));
    EXPECT_EQ(SplitEndpoint("[2001:db8::1]:443"), (std::pair<std::string, std::uint16_t>{"2001:db8::1", 443}));
    EXPECT_THROW(SplitEndpoint("vpn.example"), ConfigInvalid);
    EXPECT_THROW(SplitEndpoint("vpn.example:0"), ConfigInvalid);
    EXPECT_THROW(SplitEndpoint("vpn.example:70000"), ConfigInvalid);
    EXPECT_THROW(SplitEndpoint("2001:db8::1:443"), ConfigInvalid);
}

TEST(TunnelDefinition, SplitList)
{
    EXPECT_EQ(SplitList(" a, b ,,c "), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(SplitList("  ").empty());
}

TEST(TunnelDefinition, LoadMissingFile)
{
    EXPECT_THROW(LoadTunnelDefinition("/nonexistent/saferoute/eu.conf"), ConfigInvalid);
}

TEST(TunnelDefinition, AddressesMustBeIpLiterals)
{
    const std::string bad_address =
        "[Interface]\nPrivateKey = k\nAddress = tunnel.local/32\n"
        "[Peer]\nPublicKey = p\nEndpoint = 203.0.113.9:51820\n";
    EXPECT_THROW(ParseTunnelDefinition(bad_address, "a.conf"), ConfigInvalid);

    const std::string bad_allowed =
        "[Interface]\nPrivateKey = k\nAddress = 10.2.0.2/32\n"
        "[Peer]\nPublicKey = p\nEndpoint = 203.0.113.9:51820\nAllowedIPs = 10.0.0.0/8, everything\n";
    EXPECT_THROW(ParseTunnelDefinition(bad_allowed, "b.conf"), ConfigInvalid);

    const std::string mixed_dns =
        "[Interface]\nPrivateKey = k\nAddress = 10.2.0.2/32\nDNS = fd00:2::1, home.arpa, 10.2.0.1\n"
        "[Peer]\nPublicKey = p\nEndpoint = 203.0.113.9:51820\n";
    EXPECT_EQ(ParseTunnelDefinition(mixed_dns, "c.conf").dns_servers,
              (std::vector<std::string>{"fd00:2::1", "10.2.0.1"}));
}
