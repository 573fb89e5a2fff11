#include "Gateway.hpp"
#include "Config.hpp"
#include "Lifecycle.hpp"
#include "NetlinkBackend.hpp"
#include "PacketFilter.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <exception>
#include <iostream>
#include <string>

#include <unistd.h>

extern char **environ;

namespace
{
    bool IsElevated()
    {
        return ::geteuid() == 0;
    }

    void PrintUsage(const char *argv0)
    {
        std::cout << "Usage: " << argv0 << " [--env <file>] [--teardown]\n"
                  << "  --env <file>   configuration file (default " << Config::kDefaultEnvFile << ")\n"
                  << "  --teardown     remove routing rule, table routes and marking chain, then exit\n"
                  << "  -h, --help     show this help\n";
    }

    void ApplyLogSettings(Logger::Guard &lg, const Config::Settings &s)
    {
        if (auto sev = Logger::ParseSeverity(s.log_level))
        {
            lg.SetMinSeverity(*sev);
        }
        if (!s.log_dir.empty())
        {
            lg.EnableFile(s.log_dir);
        }
        if (s.log_syslog)
        {
            lg.EnableSyslog();
        }
    }
}

int main(int argc, char **argv)
{
    Logger::Options log_opts;
    log_opts.app_name      = "tunredirect";
    log_opts.base_filename = "tunredirect";

    Logger::Guard lg(log_opts);

    std::string env_file = Config::kDefaultEnvFile;
    bool        teardown = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--env" && i + 1 < argc) { env_file = argv[++i]; }
        else if (a == "--teardown")       { teardown = true; }
        else if (a == "-h" || a == "--help")
        {
            PrintUsage(argv[0]);
            return Gateway::kExitClean;
        }
        else
        {
            LOGE("main") << "unknown argument: " << a;
            PrintUsage(argv[0]);
            return Gateway::kExitSetupFailure;
        }
    }

    try
    {
        Config::Settings settings = Config::Resolve(env_file, Config::CaptureEnvironment(environ));
        ApplyLogSettings(lg, settings);
        // Сигналы перехватываются раньше любых изменений в системе.
        Lifecycle lifecycle(settings.stop_timeout);

        LOGI("main") << "tunredirect starting (mode " << Config::ModeName(settings.mode)
                     << (teardown ? ", teardown" : "") << ")";

        if (!IsElevated())
        {
            LOGE("main") << "Please run as root";
            return Gateway::kExitSetupFailure;
        }

        NetlinkBackend           routing;
        PacketFilter::NftBackend filter;

        if (settings.mode == Config::Mode::Tun && !PacketFilter::nft_feature_probe())
        {
            if (!teardown)
            {
                throw PacketFilterError("nftables is not usable (libnftables or kernel support missing)");
            }
            LOGW("main") << "nftables is not usable, marking chain will not be flushed";
        }

        if (teardown)
        {
            return Gateway::Teardown(settings, routing, filter) ? Gateway::kExitClean
                                                                : Gateway::kExitSetupFailure;
        }

        const int rc = Gateway::Run(settings, routing, filter, lifecycle);
        LOGI("main") << "exit code " << rc;
        return rc;
    }
    catch (const AdapterCrashError &e)
    {
        LOGE("main") << e.Stage() << " failed: " << e.what();
        return Gateway::kExitAdapterCrash;
    }
    catch (const RedirectError &e)
    {
        LOGE("main") << e.Stage() << " failed: " << e.what();
        return Gateway::kExitSetupFailure;
    }
    catch (const std::exception &e)
    {
        LOGF("main") << "fatal: " << e.what();
        return Gateway::kExitSetupFailure;
    }
}
