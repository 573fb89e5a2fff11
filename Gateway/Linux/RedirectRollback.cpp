#include "RedirectRollback.hpp"
#include "PacketMark.hpp"
#include "RoutingTable.hpp"
#include "Core/Logger.hpp"

#include <utility>

namespace
{
    constexpr const char *kIpForward = "net.ipv4.ip_forward";
}

RedirectRollback::RedirectRollback(Routing::Backend      &routing,
                                   PacketFilter::Backend *filter,
                                   Params                 params)
    : routing_(routing)
    , filter_(filter)
    , params_(std::move(params))
{
    if (params_.restore_ip_forward)
    {
        ip_forward_prev_ = NetConfig::read_sysctl(kIpForward);
        if (!ip_forward_prev_)
        {
            LOGW("rollback") << "cannot read " << kIpForward << ", it will not be restored";
        }
    }
    ok_ = !params_.restore_ip_forward || ip_forward_prev_.has_value();
    LOGD("rollback") << "snapshot taken (table " << params_.table << ", pref " << params_.rule_pref << ")";
}

RedirectRollback::~RedirectRollback()
{
    Restore();
}

void RedirectRollback::Dismiss() noexcept
{
    if (!done_)
    {
        done_ = true;
        LOGI("rollback") << "redirection state kept on exit";
    }
}

bool RedirectRollback::Restore() noexcept
{
    if (done_)
    {
        return true;
    }
    done_ = true;

    bool ok = true;
    if (routing_applied_ && !RoutingTable::Teardown(routing_, params_.table, params_.rule_pref))
    {
        ok = false;
    }

    if (filter_ && filter_applied_ &&
        !PacketMark::Remove(*filter_, params_.mark_table, params_.mark_chain))
    {
        ok = false;
    }

    if (ip_forward_prev_)
    {
        const auto now = NetConfig::read_sysctl(kIpForward);
        if (!now || *now != *ip_forward_prev_)
        {
            if (!NetConfig::write_sysctl(kIpForward, *ip_forward_prev_))
            {
                LOGW("rollback") << "cannot restore " << kIpForward << "=" << *ip_forward_prev_;
                ok = false;
            }
            else
            {
                LOGD("rollback") << kIpForward << " restored to " << *ip_forward_prev_;
            }
        }
    }

    LOGI("rollback") << (ok ? "redirection state removed" : "redirection state removed with errors");
    return ok;
}
