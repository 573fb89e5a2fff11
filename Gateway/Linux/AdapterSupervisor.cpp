#include "AdapterSupervisor.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    std::string JoinArgv(const std::vector<std::string> &argv)
    {
        std::string out;
        for (const auto &a : argv)
        {
            if (!out.empty()) out += ' ';
            out += a;
        }
        return out;
    }

    /// Только async-signal-safe вызовы: выполняется в дочернем процессе после fork().
    [[noreturn]] void ExecChild(char *const *argv, int err_fd)
    {
        sigset_t all;
        sigemptyset(&all);
        sigprocmask(SIG_SETMASK, &all, nullptr);
        std::signal(SIGINT,  SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        std::signal(SIGCHLD, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);

        // Своя группа: Ctrl-C в терминале не должен доходить до адаптера мимо супервизора.
        ::setpgid(0, 0);

        ::execvp(argv[0], argv);

        const int e = errno;
        ssize_t n;
        do
        {
            n = ::write(err_fd, &e, sizeof(e));
        } while (n < 0 && errno == EINTR);
        ::_exit(127);
    }
}

std::vector<std::string> AdapterSupervisor::BuildArgv(const std::string &binary,
                                                      const std::string &device,
                                                      const std::string &proxy)
{
    return { binary, "-device", "tun://" + device, "-proxy", proxy };
}

AdapterSupervisor::AdapterSupervisor(Params params)
    : params_(std::move(params))
{
}

AdapterSupervisor::~AdapterSupervisor()
{
    if (pid_ > 0 && state_ != State::Exited)
    {
        LOGW("adapter") << "supervisor destroyed with live adapter pid=" << pid_ << ", killing";
        Kill();
    }
}

const char *AdapterSupervisor::StateName(State s)
{
    switch (s)
    {
        case State::Idle:        return "idle";
        case State::Starting:    return "starting";
        case State::Running:     return "running";
        case State::Terminating: return "terminating";
        case State::Exited:      return "exited";
    }
    return "?";
}

void AdapterSupervisor::SetState_(State s)
{
    if (s != state_)
    {
        LOGD("adapter") << "state " << StateName(state_) << " -> " << StateName(s);
        state_ = s;
    }
}

void AdapterSupervisor::Spawn()
{
    if (state_ != State::Idle)
    {
        throw AdapterSpawnError("adapter already spawned");
    }
    if (params_.argv.empty())
    {
        throw AdapterSpawnError("empty adapter command line");
    }

    // argv собираем до fork(): в ребёнке никаких аллокаций.
    std::vector<char *> cargv;
    cargv.reserve(params_.argv.size() + 1);
    for (auto &a : params_.argv)
    {
        cargv.push_back(const_cast<char *>(a.c_str()));
    }
    cargv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0)
    {
        throw AdapterSpawnError(std::string("pipe2: ") + std::strerror(errno));
    }

    LOGI("adapter") << "spawning: " << JoinArgv(params_.argv);
    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const int e = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw AdapterSpawnError(std::string("fork: ") + std::strerror(e));
    }
    if (pid == 0)
    {
        ::close(fds[0]);
        ExecChild(cargv.data(), fds[1]);
    }

    ::close(fds[1]);

    // Пустое чтение (EOF) — exec прошёл и закрыл pipe по O_CLOEXEC.
    int     child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(fds[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        throw AdapterSpawnError("exec " + params_.argv[0] + ": " + std::strerror(child_errno));
    }

    pid_ = pid;
    SetState_(State::Starting);
    LOGI("adapter") << "started pid=" << pid_;
}

void AdapterSupervisor::WaitReady(Routing::Backend &backend)
{
    using clock = std::chrono::steady_clock;
    const auto started  = clock::now();
    const auto deadline = started + params_.ready_timeout;

    LOGD("adapter") << "waiting for " << params_.device << " (timeout "
                    << params_.ready_timeout.count() << " ms)";
    for (;;)
    {
        if (backend.LinkExists(params_.device))
        {
            const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);
            LOGI("adapter") << params_.device << " present after " << waited.count() << " ms";
            return;
        }
        if (TryReap())
        {
            throw AdapterCrashError("adapter exited before " + params_.device +
                                    " appeared (" + DescribeExit() + ")");
        }
        if (clock::now() >= deadline)
        {
            throw AdapterSpawnError(params_.device + " did not appear within " +
                                    std::to_string(params_.ready_timeout.count()) + " ms");
        }
        std::this_thread::sleep_for(params_.poll_interval);
    }
}

void AdapterSupervisor::BringUp(Routing::Backend &backend)
{
    int rc = backend.LinkSetUp(params_.device);
    if (rc != 0)
    {
        throw AdapterSpawnError("set " + params_.device + " up: " + std::strerror(-rc));
    }

    rc = backend.AddrAdd(params_.device, params_.device_addr);
    if (rc != 0 && !Routing::IsExists(rc))
    {
        throw AdapterSpawnError("add " + NetConfig::to_string(params_.device_addr) +
                                " to " + params_.device + ": " + std::strerror(-rc));
    }

    SetState_(State::Running);
    LOGI("adapter") << params_.device << " up, address " << NetConfig::to_string(params_.device_addr);
}

bool AdapterSupervisor::RequestStop()
{
    if (pid_ <= 0 || state_ == State::Exited || stop_requested_)
    {
        return false;
    }

    stop_requested_ = true;
    SetState_(State::Terminating);
    if (::kill(pid_, SIGTERM) < 0)
    {
        LOGW("adapter") << "kill(" << pid_ << ", SIGTERM): " << std::strerror(errno);
        return false;
    }
    LOGI("adapter") << "SIGTERM sent to pid=" << pid_;
    return true;
}

bool AdapterSupervisor::TryReap()
{
    if (state_ == State::Exited)
    {
        return true;
    }
    if (pid_ <= 0)
    {
        return false;
    }

    int st = 0;
    pid_t r;
    do
    {
        r = ::waitpid(pid_, &st, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == 0)
    {
        return false;
    }
    if (r < 0)
    {
        // ECHILD: процесс уже собран кем-то ещё
        LOGW("adapter") << "waitpid(" << pid_ << "): " << std::strerror(errno);
        st = 0;
    }

    status_ = st;
    SetState_(State::Exited);
    LOGI("adapter") << "pid=" << pid_ << " " << DescribeExit();
    return true;
}

void AdapterSupervisor::Kill() noexcept
{
    if (pid_ <= 0 || state_ == State::Exited)
    {
        return;
    }

    if (::kill(pid_, SIGKILL) < 0 && errno != ESRCH)
    {
        LOGW("adapter") << "kill(" << pid_ << ", SIGKILL): " << std::strerror(errno);
    }

    int st = 0;
    pid_t r;
    do
    {
        r = ::waitpid(pid_, &st, 0);
    } while (r < 0 && errno == EINTR);

    status_ = r > 0 ? st : 0;
    SetState_(State::Exited);
    LOGW("adapter") << "pid=" << pid_ << " killed";
}

std::string AdapterSupervisor::DescribeExit() const
{
    std::ostringstream os;
    if (WIFEXITED(status_))
    {
        os << "exit code " << WEXITSTATUS(status_);
    }
    else if (WIFSIGNALED(status_))
    {
        const int sig = WTERMSIG(status_);
        const char *name = ::strsignal(sig);
        os << "killed by signal " << sig << " (" << (name ? name : "?") << ")";
    }
    else
    {
        os << "status " << status_;
    }
    return os.str();
}
