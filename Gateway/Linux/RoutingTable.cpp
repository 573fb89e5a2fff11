#include "RoutingTable.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include <arpa/inet.h>

namespace RoutingTable
{
    namespace
    {
        // Защита от бесконечного цикла удаления дубликатов правил.
        constexpr int kMaxRuleDuplicates = 64;

        std::string ErrText(int rc)
        {
            return std::strerror(rc < 0 ? -rc : rc);
        }

        void DeleteRouteBestEffort(Routing::Backend     &backend,
                                   const Routing::Route &r)
        {
            const int rc = backend.RouteDelete(r);
            if (rc == 0)
            {
                LOGD("routing") << "deleted route " << Routing::Describe(r);
                return;
            }
            if (Routing::IsNotFound(rc))
            {
                LOGD("routing") << "route already absent: " << Routing::Describe(r);
                return;
            }
            throw RouteInstallError("delete route " + Routing::Describe(r) + ": " + ErrText(rc));
        }

        /// Удаляет все правила с приоритетом pref. Возвращает число удалённых.
        int DeleteRulesAtPref(Routing::Backend &backend,
                              std::uint32_t     pref)
        {
            int removed = 0;
            for (; removed < kMaxRuleDuplicates; ++removed)
            {
                const int rc = backend.RuleDelete(pref);
                if (rc == 0)
                {
                    continue;
                }
                if (Routing::IsNotFound(rc))
                {
                    break;
                }
                throw RouteInstallError("delete rule pref " + std::to_string(pref) + ": " + ErrText(rc));
            }
            if (removed >= kMaxRuleDuplicates)
            {
                throw RouteInstallError("too many rules at pref " + std::to_string(pref));
            }
            return removed;
        }

        void InstallRoute(Routing::Backend     &backend,
                          const Routing::Route &r)
        {
            const int rc = backend.RouteAdd(r);
            if (rc == 0)
            {
                LOGD("routing") << "added route " << Routing::Describe(r);
                return;
            }
            if (!Routing::IsExists(rc))
            {
                throw RouteInstallError("add route " + Routing::Describe(r) + ": " + ErrText(rc));
            }

            // Уже есть маршрут с тем же ключом: допустимо, только если он такой же.
            std::vector<Routing::Route> present;
            const int lrc = backend.RouteList(r.table, present);
            if (lrc != 0)
            {
                throw RouteInstallError("list table " + std::to_string(r.table) + ": " + ErrText(lrc));
            }
            for (const auto &p : present)
            {
                if (p == r)
                {
                    LOGD("routing") << "route already present: " << Routing::Describe(r);
                    return;
                }
            }
            throw RouteInstallError("conflicting route already present for " + Routing::Describe(r));
        }

        void InstallRule(Routing::Backend    &backend,
                         const Routing::Rule &rule)
        {
            const int rc = backend.RuleAdd(rule);
            if (rc == 0)
            {
                LOGD("routing") << "added rule " << Routing::Describe(rule);
                return;
            }
            if (Routing::IsExists(rc))
            {
                std::vector<Routing::Rule> present;
                if (backend.RuleList(present) == 0)
                {
                    for (const auto &p : present)
                    {
                        if (p == rule)
                        {
                            LOGD("routing") << "rule already present: " << Routing::Describe(rule);
                            return;
                        }
                    }
                }
                throw RouteInstallError("conflicting rule already present at pref " + std::to_string(rule.pref));
            }
            throw RouteInstallError("add rule " + Routing::Describe(rule) + ": " + ErrText(rc));
        }

        void FlushTable(Routing::Backend &backend,
                        std::uint32_t     table)
        {
            std::vector<Routing::Route> leftovers;
            const int lrc = backend.RouteList(table, leftovers);
            if (lrc != 0)
            {
                throw RouteInstallError("list table " + std::to_string(table) + ": " + ErrText(lrc));
            }
            for (const auto &r : leftovers)
            {
                DeleteRouteBestEffort(backend, r);
            }
        }

        std::string ReadAll(const std::string &path)
        {
            std::ifstream f(path, std::ios::binary);
            if (!f)
            {
                throw RegistryIOError("cannot read " + path + ": " + std::strerror(errno));
            }
            std::ostringstream ss;
            ss << f.rdbuf();
            if (f.bad())
            {
                throw RegistryIOError("read error on " + path);
            }
            return ss.str();
        }
    }

    Routing::Route LocalDefault(std::uint32_t table)
    {
        Routing::Route r;
        r.type  = Routing::RouteType::Local;
        r.dst   = NetConfig::CidrV4{ 0, 0 };
        r.dev   = "lo";
        r.table = table;
        return r;
    }

    Routing::Route LanRoute(std::uint32_t            table,
                            const NetConfig::CidrV4 &lan,
                            const std::string       &iface)
    {
        Routing::Route r;
        r.type  = Routing::RouteType::Unicast;
        r.dst   = NetConfig::to_network(lan);
        r.dev   = iface;
        r.table = table;
        return r;
    }

    std::optional<std::string> RegistryLookup(const std::string &content,
                                              std::uint32_t      id)
    {
        const std::string want = std::to_string(id);

        std::istringstream in(content);
        std::string line;
        while (std::getline(in, line))
        {
            std::istringstream ls(line);
            std::string tok;
            if (!(ls >> tok) || tok[0] == '#')
            {
                continue;
            }
            // "200" и "0xc8" — одна и та же таблица для iproute2.
            bool same = (tok == want);
            if (!same && tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X'))
            {
                char *end = nullptr;
                const unsigned long v = std::strtoul(tok.c_str(), &end, 16);
                same = end && *end == '\0' && v == id;
            }
            if (same)
            {
                std::string name;
                ls >> name;
                return name;
            }
        }
        return std::nullopt;
    }

    void EnsureTable(const std::string &registry_path,
                     std::uint32_t      id,
                     const std::string &name)
    {
        namespace fs = std::filesystem;

        std::error_code ec;
        const fs::path path(registry_path);
        if (path.has_parent_path())
        {
            fs::create_directories(path.parent_path(), ec);
            if (ec)
            {
                throw RegistryIOError("cannot create " + path.parent_path().string() + ": " + ec.message());
            }
        }

        std::string content;
        if (fs::exists(path, ec))
        {
            content = ReadAll(registry_path);
        }
        else if (ec)
        {
            throw RegistryIOError("cannot stat " + registry_path + ": " + ec.message());
        }

        if (auto existing = RegistryLookup(content, id))
        {
            if (*existing != name)
            {
                LOGW("routing") << "table " << id << " is registered as '" << *existing
                                << "', keeping it (wanted '" << name << "')";
            }
            else
            {
                LOGD("routing") << "table " << id << " already registered as " << name;
            }
            return;
        }

        std::ofstream out(registry_path, std::ios::app | std::ios::binary);
        if (!out)
        {
            throw RegistryIOError("cannot open " + registry_path + " for append: " + std::strerror(errno));
        }
        if (!content.empty() && content.back() != '\n')
        {
            out << '\n';
        }
        out << id << ' ' << name << '\n';
        out.flush();
        if (!out)
        {
            throw RegistryIOError("write to " + registry_path + " failed");
        }
        LOGI("routing") << "registered table " << id << " " << name << " in " << registry_path;
    }

    void ResetRoutes(Routing::Backend        &backend,
                     std::uint32_t            table,
                     const NetConfig::CidrV4 &lan,
                     const std::string       &iface,
                     std::uint32_t            pref,
                     std::uint32_t            mark)
    {
        const Routing::Route local_default = LocalDefault(table);
        const Routing::Route lan_route     = LanRoute(table, lan, iface);

        Routing::Rule rule;
        rule.pref   = pref;
        rule.fwmark = mark;
        rule.table  = table;

        // 1) снимаем прежнее состояние; остатки (например, default через TUN
        //    после аварийного выхода) тоже удаляются: таблица целиком наша
        DeleteRouteBestEffort(backend, local_default);
        DeleteRouteBestEffort(backend, lan_route);
        FlushTable(backend, table);
        const int removed = DeleteRulesAtPref(backend, pref);
        if (removed > 0)
        {
            LOGD("routing") << "removed " << removed << " rule(s) at pref " << pref;
        }

        // 2) маршруты, затем правило
        InstallRoute(backend, local_default);
        InstallRoute(backend, lan_route);
        InstallRule(backend, rule);

        LOGI("routing") << "table " << table << " ready: "
                        << Routing::Describe(local_default) << "; "
                        << Routing::Describe(lan_route) << "; rule "
                        << Routing::Describe(rule);
    }

    void BindTunnelRoutes(Routing::Backend  &backend,
                          std::uint32_t      table,
                          const std::string &tun)
    {
        Routing::Route via_tun;
        via_tun.type  = Routing::RouteType::Unicast;
        via_tun.dst   = NetConfig::CidrV4{ 0, 0 };
        via_tun.dev   = tun;
        via_tun.table = table;

        Routing::Route loopback;
        loopback.type  = Routing::RouteType::Unicast;
        loopback.dst   = NetConfig::CidrV4{ inet_addr("127.0.0.1"), 32 };
        loopback.dev   = "lo";
        loopback.table = table;

        // default через TUN занимает тот же ключ (0.0.0.0/0, table), что и local default
        DeleteRouteBestEffort(backend, LocalDefault(table));
        InstallRoute(backend, via_tun);
        InstallRoute(backend, loopback);

        LOGI("routing") << "table " << table << " bound to " << tun << ": "
                        << Routing::Describe(via_tun) << "; " << Routing::Describe(loopback);
    }

    bool Teardown(Routing::Backend &backend,
                  std::uint32_t     table,
                  std::uint32_t     pref) noexcept
    {
        bool ok = true;
        try
        {
            const int removed = DeleteRulesAtPref(backend, pref);
            LOGD("routing") << "teardown: removed " << removed << " rule(s) at pref " << pref;
        }
        catch (const std::exception &e)
        {
            LOGW("routing") << "teardown: " << e.what();
            ok = false;
        }

        std::vector<Routing::Route> routes;
        const int lrc = backend.RouteList(table, routes);
        if (lrc != 0)
        {
            LOGW("routing") << "teardown: list table " << table << ": " << ErrText(lrc);
            return false;
        }
        for (const auto &r : routes)
        {
            const int rc = backend.RouteDelete(r);
            if (rc != 0 && !Routing::IsNotFound(rc))
            {
                LOGW("routing") << "teardown: delete " << Routing::Describe(r) << ": " << ErrText(rc);
                ok = false;
            }
        }

        LOGI("routing") << "teardown of table " << table << (ok ? " done" : " finished with errors");
        return ok;
    }
} // namespace RoutingTable
