#include "Config.hpp"
#include "Core/Errors.hpp"
#include "FakeBackends.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <arpa/inet.h>
#include <unistd.h>

namespace
{
    class TempFile
    {
    public:
        explicit TempFile(const std::string &content)
        {
            char tmpl[] = "/tmp/tunredirect-env-XXXXXX";
            const int fd = ::mkstemp(tmpl);
            if (fd >= 0)
            {
                ::close(fd);
            }
            path_ = tmpl;
            std::ofstream(path_) << content;
        }
        ~TempFile() { std::remove(path_.c_str()); }

        const std::string &Path() const { return path_; }

    private:
        std::string path_;
    };
}

TEST(ConfigTest, DefaultsMatchReferenceDeployment)
{
    const Config::Settings s = Config::Build({});
    EXPECT_EQ(s.iface, "eth0");
    EXPECT_EQ(NetConfig::to_string(s.lan), "192.168.0.0/24");
    EXPECT_EQ(NetConfig::ipv4_to_string(s.addr_be), "192.168.0.254");
    EXPECT_EQ(s.mark, 0x2u);
    EXPECT_EQ(s.table, 200u);
    EXPECT_EQ(s.rule_pref, 99u);
    EXPECT_EQ(s.table_name, "tproxy");
    EXPECT_EQ(s.registry, "/etc/iproute2/rt_tables");
    EXPECT_EQ(s.mode, Config::Mode::Tun);
    EXPECT_EQ(s.tun_device, "tun0");
    EXPECT_EQ(NetConfig::to_string(s.tun_addr), "127.0.254.1/32");
    EXPECT_EQ(s.proxy, "socks5://127.0.0.1:1080");
    EXPECT_EQ(s.ready_timeout.count(), 10000);
    EXPECT_EQ(s.stop_timeout.count(), 5000);
    EXPECT_FALSE(s.keep_state);
    EXPECT_TRUE(s.ip_forward);
}

TEST(ConfigTest, ParsesEnvTextSyntax)
{
    std::istringstream in(
        "# comment\n"
        "\n"
        "IFACE=enp3s0\n"
        "export LAN=10.0.0.0/8\n"
        "ADDR=\"10.0.0.1\"\n"
        "TABLE_NAME='redir'\n"
        "MARK=0x10   # inline comment\n"
        "garbage line\n"
        "1BAD=x\n");
    const Config::Values v = Config::ParseEnvText(in);

    EXPECT_EQ(v.at("IFACE"), "enp3s0");
    EXPECT_EQ(v.at("LAN"), "10.0.0.0/8");
    EXPECT_EQ(v.at("ADDR"), "10.0.0.1");
    EXPECT_EQ(v.at("TABLE_NAME"), "redir");
    EXPECT_EQ(v.at("MARK"), "0x10");
    EXPECT_EQ(v.count("1BAD"), 0u);
    EXPECT_EQ(v.size(), 5u);
}

TEST(ConfigTest, EnvFileOverridesProcessEnvironment)
{
    TempFile f("IFACE=wlan0\nTABLE=300\n");
    const Config::Values env = { { "IFACE", "eth1" }, { "RULE_PREF", "120" } };

    const Config::Settings s = Config::Resolve(f.Path(), env);
    EXPECT_EQ(s.iface, "wlan0");
    EXPECT_EQ(s.table, 300u);
    EXPECT_EQ(s.rule_pref, 120u);
}

TEST(ConfigTest, MissingEnvFileFallsBackToDefaults)
{
    const Config::Settings s = Config::Resolve("/nonexistent/tunredirect.env", {});
    EXPECT_EQ(s.iface, "eth0");
    EXPECT_EQ(s.table, 200u);
}

TEST(ConfigTest, CaptureEnvironmentKeepsOnlyKnownKeys)
{
    std::string a = "IFACE=br0";
    std::string b = "HOME=/root";
    std::string c = "MODE=tproxy";
    char *envp[] = { a.data(), b.data(), c.data(), nullptr };

    const Config::Values v = Config::CaptureEnvironment(envp);
    EXPECT_EQ(v.size(), 2u);
    EXPECT_EQ(v.at("IFACE"), "br0");
    EXPECT_EQ(v.at("MODE"), "tproxy");
}

TEST(ConfigTest, LanIsNormalisedToNetwork)
{
    const Config::Settings s = Config::Build({ { "LAN", "192.168.5.17/24" } });
    EXPECT_EQ(NetConfig::to_string(s.lan), "192.168.5.0/24");
}

TEST(ConfigTest, RejectsInvalidValues)
{
    EXPECT_THROW(Config::Build({ { "TABLE", "abc" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "TABLE", "254" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "TABLE", "0" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "MARK", "0" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "MARK", "-2" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "RULE_PREF", "32766" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "LAN", "192.168.0.0/40" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "ADDR", "not-an-ip" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "MODE", "bridge" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "KEEP_STATE", "maybe" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "IFACE", "a/b" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "READY_TIMEOUT_MS", "0" } }), ConfigError);
    EXPECT_THROW(Config::Build({ { "LOG_LEVEL", "loud" } }), ConfigError);
}

TEST(ConfigTest, ErrorCarriesConfigStage)
{
    try
    {
        Config::Build({ { "TABLE", "main" } });
        FAIL() << "expected ConfigError";
    }
    catch (const RedirectError &e)
    {
        EXPECT_STREQ(e.Stage(), "config");
    }
}

TEST(ConfigTest, AcceptsHexAndBooleans)
{
    const Config::Settings s = Config::Build({ { "MARK", "0x1f" },
                                               { "TABLE", "0xc8" },
                                               { "KEEP_STATE", "yes" },
                                               { "IP_FORWARD", "off" },
                                               { "MODE", "TPROXY" } });
    EXPECT_EQ(s.mark, 0x1fu);
    EXPECT_EQ(s.table, 200u);
    EXPECT_TRUE(s.keep_state);
    EXPECT_FALSE(s.ip_forward);
    EXPECT_EQ(s.mode, Config::Mode::TProxy);
}

TEST(ConfigTest, ResolvesAutoValuesFromKernel)
{
    FakeRouting routing;
    routing.default_ifname = std::string("enp1s0");
    routing.primary_addr   = NetConfig::CidrV4{ inet_addr("10.20.30.40"), 16 };

    const Config::Settings in = Config::Build({ { "IFACE", "auto" }, { "LAN", "auto" }, { "ADDR", "auto" } });
    EXPECT_TRUE(in.iface_auto);

    const Config::Settings s = Config::ResolveAuto(in, routing);
    EXPECT_EQ(s.iface, "enp1s0");
    EXPECT_EQ(NetConfig::to_string(s.lan), "10.20.0.0/16");
    EXPECT_EQ(NetConfig::ipv4_to_string(s.addr_be), "10.20.30.40");
    EXPECT_FALSE(s.iface_auto || s.lan_auto || s.addr_auto);
}

TEST(ConfigTest, AutoWithoutDefaultRouteFails)
{
    FakeRouting routing;
    routing.default_ifname.reset();
    const Config::Settings in = Config::Build({ { "IFACE", "auto" } });
    EXPECT_THROW(Config::ResolveAuto(in, routing), ConfigError);
}

TEST(ConfigTest, ExplicitValuesSkipKernelLookup)
{
    FakeRouting routing;
    routing.default_ifname.reset();
    const Config::Settings s = Config::ResolveAuto(Config::Build({}), routing);
    EXPECT_EQ(s.iface, "eth0");
}
