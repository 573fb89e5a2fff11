#include "Config.hpp"
#include "RoutingBackend.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <net/if.h>

namespace Config
{
    namespace
    {
        const char *const kKeys[] = {
            "IFACE", "LAN", "ADDR", "MARK", "TABLE", "RULE_PREF",
            "TABLE_NAME", "RT_TABLES", "MODE",
            "TUN_DEVICE", "TUN_ADDR", "SOCKS_PROXY", "ADAPTER_BIN",
            "READY_TIMEOUT_MS", "STOP_TIMEOUT_MS",
            "KEEP_STATE", "IP_FORWARD",
            "LOG_LEVEL", "LOG_DIR", "LOG_SYSLOG",
            nullptr
        };

        bool IsKnownKey(const std::string &key)
        {
            for (const char *const *k = kKeys; *k; ++k)
            {
                if (key == *k) return true;
            }
            return false;
        }

        void TrimInPlace(std::string &s)
        {
            std::size_t a = 0;
            while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a])))
            {
                ++a;
            }
            std::size_t b = s.size();
            while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1])))
            {
                --b;
            }
            if (a != 0 || b != s.size())
            {
                s = s.substr(a, b - a);
            }
        }

        bool IsIdentifier(const std::string &s)
        {
            if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0])))
            {
                return false;
            }
            return std::all_of(s.begin(), s.end(), [](unsigned char c)
            {
                return std::isalnum(c) || c == '_';
            });
        }

        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            return s;
        }

        /// Беззнаковое 32-битное: десятичное или 0x-hex.
        std::uint32_t RequireU32(const char *key, const std::string &v)
        {
            if (v.empty() || v[0] == '-' || v[0] == '+' ||
                std::isspace(static_cast<unsigned char>(v[0])))
            {
                throw ConfigError(std::string("invalid numeric value for ") + key + ": '" + v + "'");
            }

            errno = 0;
            char *end = nullptr;
            const int base = (v.size() > 2 && v[0] == '0' && (v[1] == 'x' || v[1] == 'X')) ? 16 : 10;
            const unsigned long long n = std::strtoull(v.c_str(), &end, base);
            if (errno != 0 || end == v.c_str() || *end != '\0' || n > 0xFFFFFFFFull)
            {
                throw ConfigError(std::string("invalid numeric value for ") + key + ": '" + v + "'");
            }
            return static_cast<std::uint32_t>(n);
        }

        bool RequireBool(const char *key, const std::string &v)
        {
            const std::string s = Lower(v);
            if (s == "1" || s == "true"  || s == "yes" || s == "on")  return true;
            if (s == "0" || s == "false" || s == "no"  || s == "off") return false;
            throw ConfigError(std::string("invalid boolean value for ") + key + ": '" + v + "'");
        }

        std::string RequireIfname(const char *key, const std::string &v)
        {
            if (v.empty() || v.size() >= IFNAMSIZ ||
                v.find_first_of("/ \t") != std::string::npos)
            {
                throw ConfigError(std::string("invalid interface name for ") + key + ": '" + v + "'");
            }
            return v;
        }

        std::string RequireNonEmpty(const char *key, const std::string &v)
        {
            if (v.empty())
            {
                throw ConfigError(std::string(key) + " must not be empty");
            }
            return v;
        }

        bool IsAuto(const std::string &v)
        {
            return Lower(v) == "auto";
        }
    }

    const char *const *KnownKeys()
    {
        return kKeys;
    }

    const char *ModeName(Mode m)
    {
        return m == Mode::Tun ? "tun" : "tproxy";
    }

    Values ParseEnvText(std::istream &in)
    {
        Values out;
        std::string line;
        std::size_t lineno = 0;

        while (std::getline(in, line))
        {
            ++lineno;
            TrimInPlace(line);
            if (line.empty() || line[0] == '#')
            {
                continue;
            }
            if (line.rfind("export ", 0) == 0)
            {
                line = line.substr(7);
                TrimInPlace(line);
            }

            const auto eq = line.find('=');
            if (eq == std::string::npos)
            {
                LOGW("config") << "env line " << lineno << " ignored (no '='): " << line;
                continue;
            }

            std::string key   = line.substr(0, eq);
            std::string value = line.substr(eq + 1);
            TrimInPlace(key);
            TrimInPlace(value);

            if (!IsIdentifier(key))
            {
                LOGW("config") << "env line " << lineno << " ignored (bad key): " << key;
                continue;
            }

            if (value.size() >= 2 &&
                (value.front() == '"' || value.front() == '\'') &&
                value.back() == value.front())
            {
                value = value.substr(1, value.size() - 2);
            }
            else
            {
                // "VALUE  # comment" -> "VALUE"
                const auto hash = value.find(" #");
                if (hash != std::string::npos)
                {
                    value = value.substr(0, hash);
                    TrimInPlace(value);
                }
            }

            out[key] = value;
        }
        return out;
    }

    Values ParseEnvFile(const std::string &path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            if (ec && ec != std::errc::no_such_file_or_directory)
            {
                throw ConfigError("cannot stat env file " + path + ": " + ec.message());
            }
            LOGD("config") << "env file " << path << " not found, using defaults";
            return {};
        }

        std::ifstream f(path);
        if (!f)
        {
            throw ConfigError("cannot read env file " + path + ": " + std::strerror(errno));
        }
        return ParseEnvText(f);
    }

    Values CaptureEnvironment(char **envp)
    {
        Values out;
        if (!envp)
        {
            return out;
        }
        for (char **e = envp; *e; ++e)
        {
            const std::string kv = *e;
            const auto eq = kv.find('=');
            if (eq == std::string::npos) continue;

            std::string key = kv.substr(0, eq);
            if (IsKnownKey(key))
            {
                out[key] = kv.substr(eq + 1);
            }
        }
        return out;
    }

    Settings Build(const Values &values)
    {
        Settings s;

        for (const auto &kv : values)
        {
            const std::string &key = kv.first;
            const std::string &v   = kv.second;

            if (key == "IFACE")
            {
                if (IsAuto(v)) s.iface_auto = true;
                else           s.iface = RequireIfname("IFACE", v);
            }
            else if (key == "LAN")
            {
                if (IsAuto(v))
                {
                    s.lan_auto = true;
                }
                else
                {
                    NetConfig::CidrV4 c{};
                    if (!NetConfig::parse_cidr4(v, c))
                    {
                        throw ConfigError("invalid LAN CIDR: '" + v + "'");
                    }
                    s.lan = NetConfig::to_network(c);
                }
            }
            else if (key == "ADDR")
            {
                if (IsAuto(v))
                {
                    s.addr_auto = true;
                }
                else if (!NetConfig::parse_ipv4(v, s.addr_be))
                {
                    throw ConfigError("invalid ADDR: '" + v + "'");
                }
            }
            else if (key == "MARK")
            {
                s.mark = RequireU32("MARK", v);
                if (s.mark == 0)
                {
                    throw ConfigError("MARK must be non-zero");
                }
            }
            else if (key == "TABLE")
            {
                s.table = RequireU32("TABLE", v);
                if (s.table == 0 || s.table == 253 || s.table == 254 || s.table == 255)
                {
                    throw ConfigError("TABLE " + v + " collides with a reserved table id");
                }
            }
            else if (key == "RULE_PREF")
            {
                s.rule_pref = RequireU32("RULE_PREF", v);
                if (s.rule_pref == 0 || s.rule_pref > 32765)
                {
                    throw ConfigError("RULE_PREF must be in 1..32765, got " + v);
                }
            }
            else if (key == "TABLE_NAME")
            {
                s.table_name = RequireNonEmpty("TABLE_NAME", v);
                if (s.table_name.find_first_of(" \t#") != std::string::npos)
                {
                    throw ConfigError("invalid TABLE_NAME: '" + v + "'");
                }
            }
            else if (key == "RT_TABLES")
            {
                s.registry = RequireNonEmpty("RT_TABLES", v);
            }
            else if (key == "MODE")
            {
                const std::string m = Lower(v);
                if (m == "tun")         s.mode = Mode::Tun;
                else if (m == "tproxy") s.mode = Mode::TProxy;
                else throw ConfigError("unknown MODE: '" + v + "' (expected tun or tproxy)");
            }
            else if (key == "TUN_DEVICE")
            {
                s.tun_device = RequireIfname("TUN_DEVICE", v);
            }
            else if (key == "TUN_ADDR")
            {
                if (!NetConfig::parse_cidr4(v, s.tun_addr))
                {
                    throw ConfigError("invalid TUN_ADDR: '" + v + "'");
                }
            }
            else if (key == "SOCKS_PROXY")
            {
                s.proxy = RequireNonEmpty("SOCKS_PROXY", v);
            }
            else if (key == "ADAPTER_BIN")
            {
                s.adapter_bin = RequireNonEmpty("ADAPTER_BIN", v);
            }
            else if (key == "READY_TIMEOUT_MS" || key == "STOP_TIMEOUT_MS")
            {
                const std::uint32_t ms = RequireU32(key.c_str(), v);
                if (ms == 0)
                {
                    throw ConfigError(key + " must be positive");
                }
                (key == "READY_TIMEOUT_MS" ? s.ready_timeout : s.stop_timeout) =
                    std::chrono::milliseconds(ms);
            }
            else if (key == "KEEP_STATE")
            {
                s.keep_state = RequireBool("KEEP_STATE", v);
            }
            else if (key == "IP_FORWARD")
            {
                s.ip_forward = RequireBool("IP_FORWARD", v);
            }
            else if (key == "LOG_LEVEL")
            {
                if (!Logger::ParseSeverity(v))
                {
                    throw ConfigError("unknown LOG_LEVEL: '" + v + "'");
                }
                s.log_level = Lower(v);
            }
            else if (key == "LOG_DIR")
            {
                s.log_dir = v;
            }
            else if (key == "LOG_SYSLOG")
            {
                s.log_syslog = RequireBool("LOG_SYSLOG", v);
            }
            else
            {
                LOGD("config") << "unknown key ignored: " << key;
            }
        }

        return s;
    }

    Settings Resolve(const std::string &env_file,
                     const Values      &process_env)
    {
        Values merged = process_env;
        for (const auto &kv : ParseEnvFile(env_file))
        {
            merged[kv.first] = kv.second;
        }
        return Build(merged);
    }

    Settings ResolveAuto(const Settings   &in,
                         Routing::Backend &backend)
    {
        Settings s = in;

        if (s.iface_auto)
        {
            auto name = backend.DefaultRouteIfname();
            if (!name)
            {
                throw ConfigError("IFACE=auto: no default route in the main table");
            }
            s.iface      = *name;
            s.iface_auto = false;
            LOGI("config") << "IFACE=auto resolved to " << s.iface;
        }

        if (s.lan_auto || s.addr_auto)
        {
            auto primary = backend.PrimaryAddr(s.iface);
            if (!primary)
            {
                throw ConfigError("LAN/ADDR=auto: no global IPv4 address on " + s.iface);
            }
            if (s.addr_auto)
            {
                s.addr_be   = primary->addr_be;
                s.addr_auto = false;
                LOGI("config") << "ADDR=auto resolved to " << NetConfig::ipv4_to_string(s.addr_be);
            }
            if (s.lan_auto)
            {
                s.lan      = NetConfig::to_network(*primary);
                s.lan_auto = false;
                LOGI("config") << "LAN=auto resolved to " << NetConfig::to_string(s.lan);
            }
        }

        return s;
    }

    std::string Summary(const Settings &s)
    {
        std::ostringstream os;
        os << "mode=" << ModeName(s.mode)
           << " iface=" << (s.iface_auto ? std::string("auto") : s.iface)
           << " lan=" << (s.lan_auto ? std::string("auto") : NetConfig::to_string(s.lan))
           << " addr=" << (s.addr_auto ? std::string("auto") : NetConfig::ipv4_to_string(s.addr_be))
           << " mark=0x" << std::hex << s.mark << std::dec
           << " table=" << s.table << "(" << s.table_name << ")"
           << " pref=" << s.rule_pref;
        if (s.mode == Mode::Tun)
        {
            os << " tun=" << s.tun_device
               << " tun_addr=" << NetConfig::to_string(s.tun_addr)
               << " proxy=" << s.proxy
               << " adapter=" << s.adapter_bin;
        }
        os << " keep_state=" << (s.keep_state ? "yes" : "no");
        return os.str();
    }
} // namespace Config
