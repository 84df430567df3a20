#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "ph/internal/net_iface.hpp"

using ph::internal::InterfaceAddr;

TEST(NetIface, SelectsNamedInterfaceThatIsUp) {
    std::vector<InterfaceAddr> table{
        {"lo", "127.0.0.1", true},
        {"eth0", "10.0.0.5", true},
        {"wlan0", "192.168.1.23", true},
    };
    auto ip = ph::internal::select_interface_address(table, "wlan0");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "192.168.1.23");
}

TEST(NetIface, SkipsInterfaceThatIsDown) {
    std::vector<InterfaceAddr> table{
        {"wlan0", "192.168.1.23", false},
    };
    EXPECT_FALSE(ph::internal::select_interface_address(table, "wlan0").has_value());
}

TEST(NetIface, LastUpEntryWins) {
    std::vector<InterfaceAddr> table{
        {"en0", "192.168.0.10", true},
        {"en0", "192.168.0.11", true},
        {"en0", "169.254.3.3", false},
        {"lo", "127.0.0.1", true},
    };
    auto ip = ph::internal::select_interface_address(table, "en0");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "192.168.0.11");
}

TEST(NetIface, NoMatchIsNullopt) {
    std::vector<InterfaceAddr> table{
        {"lo", "127.0.0.1", true},
    };
    EXPECT_FALSE(ph::internal::select_interface_address(table, "wlan0").has_value());
    EXPECT_FALSE(ph::internal::select_interface_address({}, "wlan0").has_value());
}

TEST(NetIface, LiveTableHasOnlyIpv4Entries) {
    for (const auto& a : ph::internal::list_ipv4_interfaces()) {
        EXPECT_FALSE(a.name.empty());
        EXPECT_EQ(a.ip.find(':'), std::string::npos) << a.ip;
        EXPECT_EQ(std::count(a.ip.begin(), a.ip.end(), '.'), 3) << a.ip;
    }
}

TEST(NetIface, UnknownInterfaceResolvesToNothing) {
    EXPECT_FALSE(ph::internal::resolve_local_address("ph-no-such-if0").has_value());
}

TEST(NetIface, LoopbackResolvesWhenPresent) {
    auto table = ph::internal::list_ipv4_interfaces();
    if (!ph::internal::select_interface_address(table, "lo")) {
        GTEST_SKIP() << "no IPv4 loopback interface named lo";
    }
    auto ip = ph::internal::resolve_local_address("lo");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(ip->rfind("127.", 0), 0u) << *ip;
}
