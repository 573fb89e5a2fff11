#include "AdapterSupervisor.hpp"
#include "Core/Errors.hpp"
#include "FakeBackends.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <thread>

#include <arpa/inet.h>
#include <sys/wait.h>

namespace
{
    AdapterSupervisor::Params Cmd(std::vector<std::string> argv)
    {
        AdapterSupervisor::Params p;
        p.argv          = std::move(argv);
        p.device        = "tun0";
        p.device_addr   = NetConfig::CidrV4{ inet_addr("127.0.254.1"), 32 };
        p.ready_timeout = std::chrono::milliseconds(300);
        p.poll_interval = std::chrono::milliseconds(20);
        return p;
    }

    bool WaitExited(AdapterSupervisor &sup, std::chrono::milliseconds limit)
    {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (sup.TryReap()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return sup.TryReap();
    }

    bool ProcessGone(pid_t pid)
    {
        return ::kill(pid, 0) < 0 && errno == ESRCH;
    }
}

TEST(AdapterSupervisorTest, BuildsTun2SocksCommandLine)
{
    const auto argv = AdapterSupervisor::BuildArgv("/usr/local/bin/tun2socks", "tun0", "socks5://127.0.0.1:1080");
    const std::vector<std::string> expected = {
        "/usr/local/bin/tun2socks", "-device", "tun://tun0", "-proxy", "socks5://127.0.0.1:1080"
    };
    EXPECT_EQ(argv, expected);
}

TEST(AdapterSupervisorTest, MissingBinaryIsSpawnError)
{
    AdapterSupervisor sup(Cmd({ "/nonexistent/tun2socks", "-device", "tun://tun0" }));
    try
    {
        sup.Spawn();
        FAIL() << "expected AdapterSpawnError";
    }
    catch (const AdapterSpawnError &e)
    {
        EXPECT_STREQ(e.Stage(), "adapter-spawn");
        EXPECT_NE(std::string(e.what()).find("/nonexistent/tun2socks"), std::string::npos);
    }
    EXPECT_EQ(sup.GetState(), AdapterSupervisor::State::Idle);
}

TEST(AdapterSupervisorTest, SigtermStopsAdapter)
{
    AdapterSupervisor sup(Cmd({ "/bin/sleep", "30" }));
    sup.Spawn();
    EXPECT_EQ(sup.GetState(), AdapterSupervisor::State::Starting);
    const pid_t pid = sup.Pid();

    EXPECT_TRUE(sup.RequestStop());
    EXPECT_FALSE(sup.RequestStop());
    EXPECT_EQ(sup.GetState(), AdapterSupervisor::State::Terminating);

    ASSERT_TRUE(WaitExited(sup, std::chrono::milliseconds(5000)));
    EXPECT_EQ(sup.GetState(), AdapterSupervisor::State::Exited);
    EXPECT_TRUE(WIFSIGNALED(sup.RawStatus()));
    EXPECT_EQ(WTERMSIG(sup.RawStatus()), SIGTERM);
    EXPECT_TRUE(ProcessGone(pid));
}

TEST(AdapterSupervisorTest, WaitReadyAndBringUp)
{
    FakeRouting routing;
    routing.links.insert("tun0");

    AdapterSupervisor sup(Cmd({ "/bin/sleep", "30" }));
    sup.Spawn();
    sup.WaitReady(routing);
    sup.BringUp(routing);

    EXPECT_EQ(sup.GetState(), AdapterSupervisor::State::Running);
    EXPECT_EQ(routing.up.count("tun0"), 1u);
    ASSERT_EQ(routing.addrs["tun0"].size(), 1u);
    EXPECT_EQ(NetConfig::to_string(routing.addrs["tun0"][0]), "127.0.254.1/32");

    // адрес уже назначен — не ошибка
    EXPECT_NO_THROW(sup.BringUp(routing));
}

TEST(AdapterSupervisorTest, ReadinessTimeout)
{
    FakeRouting routing;
    AdapterSupervisor sup(Cmd({ "/bin/sleep", "30" }));
    sup.Spawn();

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(sup.WaitReady(routing), AdapterSpawnError);
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(300));
}

TEST(AdapterSupervisorTest, ExitDuringReadinessIsCrash)
{
    FakeRouting routing;
    AdapterSupervisor sup(Cmd({ "/bin/sh", "-c", "exit 3" }));
    sup.Spawn();

    try
    {
        sup.WaitReady(routing);
        FAIL() << "expected AdapterCrashError";
    }
    catch (const AdapterCrashError &e)
    {
        EXPECT_STREQ(e.Stage(), "adapter");
    }
    EXPECT_EQ(sup.GetState(), AdapterSupervisor::State::Exited);
    EXPECT_EQ(sup.DescribeExit(), "exit code 3");
}

TEST(AdapterSupervisorTest, LinkUpFailureIsSpawnError)
{
    FakeRouting routing;
    routing.links.insert("tun0");
    routing.link_up_error = -EPERM;

    AdapterSupervisor sup(Cmd({ "/bin/sleep", "30" }));
    sup.Spawn();
    sup.WaitReady(routing);
    EXPECT_THROW(sup.BringUp(routing), AdapterSpawnError);
}

TEST(AdapterSupervisorTest, DestructorLeavesNoOrphan)
{
    pid_t pid = -1;
    {
        AdapterSupervisor sup(Cmd({ "/bin/sleep", "30" }));
        sup.Spawn();
        pid = sup.Pid();
        ASSERT_GT(pid, 0);
        EXPECT_FALSE(ProcessGone(pid));
    }
    EXPECT_TRUE(ProcessGone(pid));
}

TEST(AdapterSupervisorTest, KillReapsImmediately)
{
    AdapterSupervisor sup(Cmd({ "/bin/sleep", "30" }));
    sup.Spawn();
    const pid_t pid = sup.Pid();

    sup.Kill();
    EXPECT_EQ(sup.GetState(), AdapterSupervisor::State::Exited);
    EXPECT_TRUE(WIFSIGNALED(sup.RawStatus()));
    EXPECT_EQ(WTERMSIG(sup.RawStatus()), SIGKILL);
    EXPECT_TRUE(ProcessGone(pid));
    EXPECT_FALSE(sup.RequestStop());
}
