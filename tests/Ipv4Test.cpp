#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include "../common/Ipv4.hpp"

using namespace lan_watch::common;

TEST(Ipv4Test, ParsesAndFormatsDottedQuad)
{
    auto value = ParseIpv4("192.168.178.20");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 0xC0A8B214u);
    EXPECT_EQ(FormatIpv4(value.value()), "192.168.178.20");
}

TEST(Ipv4Test, RejectsMalformedAddresses)
{
    EXPECT_FALSE(ParseIpv4("").has_value());
    EXPECT_FALSE(ParseIpv4("10.0.0").has_value());
    EXPECT_FALSE(ParseIpv4("10.0.0.256").has_value());
    EXPECT_FALSE(ParseIpv4("printer").has_value());
    EXPECT_FALSE(ParseIpv4("::1").has_value());
}

TEST(Ipv4Test, CidrMasksHostBits)
{
    Cidr cidr = ParseCidr("10.0.0.77/24");
    EXPECT_EQ(FormatIpv4(cidr.network), "10.0.0.0");
    EXPECT_EQ(cidr.prefix_length, 24);
}

TEST(Ipv4Test, CidrWithoutPrefixIsSingleHost)
{
    Cidr cidr = ParseCidr("10.0.0.5");
    EXPECT_EQ(cidr.prefix_length, 32);
    EXPECT_EQ(ExpandHosts(cidr), std::vector<std::string>{"10.0.0.5"});
}

TEST(Ipv4Test, CidrRejectsBadInput)
{
    EXPECT_THROW(ParseCidr("10.0.0.0/33"), std::invalid_argument);
    EXPECT_THROW(ParseCidr("10.0.0.0/"), std::invalid_argument);
    EXPECT_THROW(ParseCidr("10.0.0.0/abc"), std::invalid_argument);
    EXPECT_THROW(ParseCidr("lan/24"), std::invalid_argument);
}

TEST(Ipv4Test, ExpandHostsSkipsNetworkAndBroadcast)
{
    auto hosts = ExpandHosts(ParseCidr("192.168.1.0/24"));
    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(hosts.front(), "192.168.1.1");
    EXPECT_EQ(hosts.back(), "192.168.1.254");
    EXPECT_EQ(HostCount(ParseCidr("192.168.1.0/24")), 254u);
}

TEST(Ipv4Test, ExpandHostsPointToPointKeepsBothAddresses)
{
    auto hosts = ExpandHosts(ParseCidr("10.0.0.2/31"));
    EXPECT_EQ(hosts, (std::vector<std::string>{"10.0.0.2", "10.0.0.3"}));
}

TEST(Ipv4Test, AddressLessIsNumericNotLexical)
{
    std::vector<std::string> ips = {"10.0.0.10", "10.0.0.9", "9.255.255.255", "10.0.0.100"};
    std::sort(ips.begin(), ips.end(), AddressLess);
    EXPECT_EQ(ips, (std::vector<std::string>{"9.255.255.255", "10.0.0.9", "10.0.0.10", "10.0.0.100"}));
}
