#include "RoutingTable.hpp"
#include "Core/Errors.hpp"
#include "FakeBackends.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <arpa/inet.h>
#include <unistd.h>

namespace
{
    const NetConfig::CidrV4 kLan{ inet_addr("192.168.0.0"), 24 };

    std::string ReadFile(const std::string &path)
    {
        std::ifstream f(path);
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    std::size_t CountLines(const std::string &content, const std::string &line)
    {
        std::istringstream in(content);
        std::string l;
        std::size_t n = 0;
        while (std::getline(in, l))
        {
            if (l == line) ++n;
        }
        return n;
    }

    class RegistryFixture : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            char tmpl[] = "/tmp/tunredirect-rt-XXXXXX";
            ASSERT_NE(::mkdtemp(tmpl), nullptr);
            dir_  = tmpl;
            path_ = dir_ + "/iproute2/rt_tables";
        }
        void TearDown() override
        {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }

        void Write(const std::string &content)
        {
            std::filesystem::create_directories(std::filesystem::path(path_).parent_path());
            std::ofstream(path_) << content;
        }

        std::string dir_;
        std::string path_;
    };

    using RoutingTableTest = RegistryFixture;
}

TEST_F(RoutingTableTest, EnsureTableCreatesMissingRegistry)
{
    RoutingTable::EnsureTable(path_, 200, "tproxy");
    EXPECT_EQ(ReadFile(path_), "200 tproxy\n");
}

TEST_F(RoutingTableTest, EnsureTableTwiceDoesNotDuplicate)
{
    Write("255\tlocal\n254\tmain\n");
    RoutingTable::EnsureTable(path_, 200, "tproxy");
    RoutingTable::EnsureTable(path_, 200, "tproxy");

    const std::string content = ReadFile(path_);
    EXPECT_EQ(CountLines(content, "200 tproxy"), 1u);
    EXPECT_EQ(CountLines(content, "254\tmain"), 1u);
    EXPECT_EQ(CountLines(content, "255\tlocal"), 1u);
}

TEST_F(RoutingTableTest, EnsureTableHandlesMissingTrailingNewline)
{
    Write("254\tmain");
    RoutingTable::EnsureTable(path_, 200, "tproxy");
    EXPECT_EQ(ReadFile(path_), "254\tmain\n200 tproxy\n");
}

TEST_F(RoutingTableTest, EnsureTableKeepsExistingNameForId)
{
    Write("200 other\n");
    RoutingTable::EnsureTable(path_, 200, "tproxy");
    EXPECT_EQ(ReadFile(path_), "200 other\n");
}

TEST_F(RoutingTableTest, EnsureTableUnwritableRegistryFails)
{
    if (::geteuid() == 0)
    {
        GTEST_SKIP() << "root ignores file permissions";
    }
    Write("254\tmain\n");
    std::filesystem::permissions(path_, std::filesystem::perms::owner_read);
    EXPECT_THROW(RoutingTable::EnsureTable(path_, 200, "tproxy"), RegistryIOError);
}

TEST(RoutingTableLookupTest, RegistryLookup)
{
    const std::string content = "# reserved\n255 local\n0xc8 tproxy\n  201   other # note\n";
    EXPECT_EQ(RoutingTable::RegistryLookup(content, 200).value_or(""), "tproxy");
    EXPECT_EQ(RoutingTable::RegistryLookup(content, 201).value_or(""), "other");
    EXPECT_FALSE(RoutingTable::RegistryLookup(content, 202).has_value());
}

TEST(ResetRoutesTest, InstallsExactlyTwoRoutesAndOneRule)
{
    FakeRouting routing;
    RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);

    const auto table = routing.Table(200);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_NE(std::find(table.begin(), table.end(), RoutingTable::LocalDefault(200)), table.end());
    EXPECT_NE(std::find(table.begin(), table.end(), RoutingTable::LanRoute(200, kLan, "eth0")), table.end());

    ASSERT_EQ(routing.rules.size(), 1u);
    EXPECT_EQ(routing.rules[0].pref, 99u);
    EXPECT_EQ(routing.rules[0].fwmark, 0x2u);
    EXPECT_EQ(routing.rules[0].table, 200u);
}

TEST(ResetRoutesTest, RepeatedRunsConverge)
{
    FakeRouting routing;
    RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
    const auto first_routes = routing.routes;
    const auto first_rules  = routing.rules;

    RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
    EXPECT_EQ(routing.routes, first_routes);
    EXPECT_EQ(routing.rules, first_rules);
}

TEST(ResetRoutesTest, RemovesDuplicateRulesAtPreference)
{
    FakeRouting routing;
    routing.rules.push_back({ 99, 0x2, 200 });
    routing.rules.push_back({ 99, 0x2, 200 });
    routing.rules.push_back({ 99, 0x5, 201 });
    routing.rules.push_back({ 100, 0x2, 200 });

    RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
    EXPECT_EQ(routing.RulesAt(99), 1u);
    EXPECT_EQ(routing.RulesAt(100), 1u);
}

TEST(ResetRoutesTest, ClearsLeftoversFromTunnelMode)
{
    FakeRouting routing;
    RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
    RoutingTable::BindTunnelRoutes(routing, 200, "tun0");

    RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
    const auto table = routing.Table(200);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_NE(std::find(table.begin(), table.end(), RoutingTable::LocalDefault(200)), table.end());
}

TEST(ResetRoutesTest, LeavesOtherTablesAlone)
{
    FakeRouting routing;
    Routing::Route main_default;
    main_default.dst   = NetConfig::CidrV4{ 0, 0 };
    main_default.dev   = "eth0";
    main_default.table = 254;
    routing.routes.push_back(main_default);

    RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
    EXPECT_EQ(routing.Table(254).size(), 1u);
}

TEST(ResetRoutesTest, RouteAddFailureIsFatal)
{
    FakeRouting routing;
    routing.route_add_error = -EPERM;
    try
    {
        RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
        FAIL() << "expected RouteInstallError";
    }
    catch (const RouteInstallError &e)
    {
        EXPECT_STREQ(e.Stage(), "routing");
    }
    EXPECT_TRUE(routing.rules.empty());
}

TEST(ResetRoutesTest, RuleDeleteFailureIsFatal)
{
    FakeRouting routing;
    routing.rule_delete_error = -EPERM;
    EXPECT_THROW(RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2), RouteInstallError);
}

TEST(ResetRoutesTest, AbsentRoutesAreNotErrors)
{
    FakeRouting routing;
    EXPECT_NO_THROW(RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2));
}

// Ядро не всегда удаляет чужой маршрут по нашему ключу: RouteAdd тогда
// отвечает EEXIST и решает сравнение с тем, что уже лежит в таблице.
TEST(ResetRoutesTest, IdenticalExistingRouteTolerated)
{
    StickyRouting routing;
    routing.routes.push_back(RoutingTable::LocalDefault(200));
    routing.routes.push_back(RoutingTable::LanRoute(200, kLan, "eth0"));

    EXPECT_NO_THROW(RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2));
    EXPECT_EQ(routing.Table(200).size(), 2u);
    EXPECT_EQ(routing.RulesAt(99), 1u);
}

TEST(ResetRoutesTest, DivergentExistingRouteIsFatal)
{
    StickyRouting routing;
    Routing::Route foreign;
    foreign.type  = Routing::RouteType::Unicast;
    foreign.dst   = NetConfig::CidrV4{ 0, 0 };
    foreign.dev   = "eth1";
    foreign.table = 200;
    routing.routes.push_back(foreign);

    EXPECT_THROW(RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2), RouteInstallError);
    EXPECT_TRUE(routing.rules.empty());
}

TEST(ResetRoutesTest, IdenticalExistingRuleTolerated)
{
    StickyRouting routing;
    routing.rules.push_back({ 99, 0x2, 200 });

    EXPECT_NO_THROW(RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2));
    EXPECT_EQ(routing.RulesAt(99), 1u);
    EXPECT_EQ(routing.Table(200).size(), 2u);
}

TEST(ResetRoutesTest, DivergentExistingRuleIsFatal)
{
    StickyRouting routing;
    routing.rules.push_back({ 99, 0x5, 201 });

    try
    {
        RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
        FAIL() << "expected RouteInstallError";
    }
    catch (const RouteInstallError &e)
    {
        EXPECT_NE(std::string(e.what()).find("pref 99"), std::string::npos);
    }
    ASSERT_EQ(routing.RulesAt(99), 1u);
    EXPECT_EQ(routing.rules[0].table, 201u);
}

TEST(BindTunnelRoutesTest, ReplacesLocalDefaultWithTunnel)
{
    FakeRouting routing;
    RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
    RoutingTable::BindTunnelRoutes(routing, 200, "tun0");

    const auto table = routing.Table(200);
    ASSERT_EQ(table.size(), 3u);
    EXPECT_EQ(std::find(table.begin(), table.end(), RoutingTable::LocalDefault(200)), table.end());

    Routing::Route via_tun;
    via_tun.dst   = NetConfig::CidrV4{ 0, 0 };
    via_tun.dev   = "tun0";
    via_tun.table = 200;
    EXPECT_NE(std::find(table.begin(), table.end(), via_tun), table.end());

    Routing::Route loopback;
    loopback.dst   = NetConfig::CidrV4{ inet_addr("127.0.0.1"), 32 };
    loopback.dev   = "lo";
    loopback.table = 200;
    EXPECT_NE(std::find(table.begin(), table.end(), loopback), table.end());
}

TEST(TeardownTest, RemovesRuleAndTableRoutes)
{
    FakeRouting routing;
    RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
    routing.rules.push_back({ 99, 0x2, 200 });

    EXPECT_TRUE(RoutingTable::Teardown(routing, 200, 99));
    EXPECT_TRUE(routing.Table(200).empty());
    EXPECT_EQ(routing.RulesAt(99), 0u);
}

TEST(TeardownTest, CleanStateIsOk)
{
    FakeRouting routing;
    EXPECT_TRUE(RoutingTable::Teardown(routing, 200, 99));
}

TEST(TeardownTest, ReportsFailuresWithoutThrowing)
{
    FakeRouting routing;
    RoutingTable::ResetRoutes(routing, 200, kLan, "eth0", 99, 0x2);
    routing.route_delete_error = -EPERM;
    EXPECT_FALSE(RoutingTable::Teardown(routing, 200, 99));
}
