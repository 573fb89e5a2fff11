#include "Gateway.hpp"
#include "AdapterSupervisor.hpp"
#include "PacketMark.hpp"
#include "RedirectRollback.hpp"
#include "RoutingTable.hpp"
#include "Core/Logger.hpp"

#include <optional>

namespace Gateway
{
    namespace
    {
        void EnableForwarding()
        {
            const auto cur = NetConfig::read_sysctl("net.ipv4.ip_forward");
            if (cur && *cur == "1")
            {
                LOGD("gateway") << "ip_forward already enabled";
                return;
            }
            if (!NetConfig::write_sysctl("net.ipv4.ip_forward", "1"))
            {
                LOGW("gateway") << "cannot enable net.ipv4.ip_forward";
                return;
            }
            LOGI("gateway") << "net.ipv4.ip_forward=1";
        }
    }

    void SetupRouting(const Config::Settings &s, Routing::Backend &routing)
    {
        LOGI("gateway") << "routing: table " << s.table << " (" << s.table_name << ")";
        RoutingTable::EnsureTable(s.registry, s.table, s.table_name);
        RoutingTable::ResetRoutes(routing, s.table, s.lan, s.iface, s.rule_pref, s.mark);
    }

    int Run(const Config::Settings &settings,
            Routing::Backend       &routing,
            PacketFilter::Backend  &filter,
            Lifecycle              &lifecycle)
    {
        const Config::Settings s = Config::ResolveAuto(settings, routing);
        LOGI("gateway") << "config: " << Config::Summary(s);

        if (s.mode == Config::Mode::TProxy)
        {
            if (s.ip_forward)
            {
                EnableForwarding();
            }
            SetupRouting(s, routing);
            LOGI("gateway") << "tproxy mode: routing installed, state is left in place";
            return kExitClean;
        }

        // Снимок до любых изменений; уничтожается последним.
        std::optional<RedirectRollback> rollback;
        if (!s.keep_state)
        {
            RedirectRollback::Params rp;
            rp.table              = s.table;
            rp.rule_pref          = s.rule_pref;
            rp.mark_table         = PacketMark::kTable;
            rp.mark_chain         = PacketMark::kChain;
            rp.restore_ip_forward = s.ip_forward;
            rollback.emplace(routing, &filter, rp);
        }

        if (s.ip_forward)
        {
            EnableForwarding();
        }

        LOGI("gateway") << "routing: table " << s.table << " (" << s.table_name << ")";
        RoutingTable::EnsureTable(s.registry, s.table, s.table_name);
        // Частичный сбой ResetRoutes тоже оставляет таблицу изменённой.
        if (rollback)
        {
            rollback->MarkRoutingApplied();
        }
        RoutingTable::ResetRoutes(routing, s.table, s.lan, s.iface, s.rule_pref, s.mark);

        LOGI("gateway") << "packet marking on " << s.iface;
        PacketMark::Install(filter, s.iface, s.lan, s.addr_be, s.mark);
        if (rollback)
        {
            rollback->MarkFilterApplied();
        }

        AdapterSupervisor::Params ap;
        ap.argv          = AdapterSupervisor::BuildArgv(s.adapter_bin, s.tun_device, s.proxy);
        ap.device        = s.tun_device;
        ap.device_addr   = s.tun_addr;
        ap.ready_timeout = s.ready_timeout;
        AdapterSupervisor supervisor(ap);

        supervisor.Spawn();
        supervisor.WaitReady(routing);
        supervisor.BringUp(routing);

        RoutingTable::BindTunnelRoutes(routing, s.table, s.tun_device);
        LOGI("gateway") << "redirection active: " << s.iface << " " << NetConfig::to_string(s.lan)
                        << " -> " << s.tun_device << " -> " << s.proxy;

        const Lifecycle::Outcome outcome = lifecycle.Run(supervisor);
        return outcome == Lifecycle::Outcome::Clean ? kExitClean : kExitAdapterCrash;
    }

    bool Teardown(const Config::Settings &settings,
                  Routing::Backend       &routing,
                  PacketFilter::Backend  &filter) noexcept
    {
        LOGI("gateway") << "teardown: table " << settings.table << ", pref " << settings.rule_pref;
        bool ok = RoutingTable::Teardown(routing, settings.table, settings.rule_pref);
        if (!PacketMark::Remove(filter))
        {
            ok = false;
        }
        return ok;
    }
} // namespace Gateway
