#include "NetlinkBackend.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <net/if.h>

#include <linux/fib_rules.h>
#include <linux/if_addr.h>
#include <linux/rtnetlink.h>

#include <netlink/addr.h>
#include <netlink/cache.h>
#include <netlink/errno.h>
#include <netlink/route/addr.h>
#include <netlink/route/link.h>
#include <netlink/route/nexthop.h>
#include <netlink/route/rule.h>

namespace
{
    nl_addr *BuildAddr4(const NetConfig::CidrV4 &c)
    {
        nl_addr *a = nl_addr_build(AF_INET, &c.addr_be, sizeof(c.addr_be));
        if (a)
        {
            nl_addr_set_prefixlen(a, c.prefix);
        }
        return a;
    }

    NetConfig::CidrV4 FromNlAddr(nl_addr *a)
    {
        NetConfig::CidrV4 out{};
        out.prefix = 0;
        if (!a)
        {
            return out;
        }
        if (nl_addr_get_len(a) == sizeof(std::uint32_t))
        {
            std::memcpy(&out.addr_be, nl_addr_get_binary_addr(a), sizeof(std::uint32_t));
        }
        out.prefix = static_cast<std::uint8_t>(nl_addr_get_prefixlen(a));
        return out;
    }

    std::string IndexToName(int ifindex)
    {
        char name[IF_NAMESIZE] = {};
        if (ifindex <= 0 || ::if_indextoname(static_cast<unsigned>(ifindex), name) == nullptr)
        {
            return {};
        }
        return name;
    }
}

NetlinkBackend::NetlinkBackend()
{
    sk_ = NetConfig::nl_connect_route();
    if (!sk_)
    {
        throw RouteInstallError("cannot open NETLINK_ROUTE socket");
    }
    LOGD("netlink") << "NETLINK_ROUTE socket connected";
}

NetlinkBackend::~NetlinkBackend()
{
    if (sk_)
    {
        nl_socket_free(sk_);
        sk_ = nullptr;
    }
}

int NetlinkBackend::ToErrno_(int nl_rc)
{
    if (nl_rc >= 0)
    {
        return 0;
    }
    switch (-nl_rc)
    {
        case NLE_EXIST:        return -EEXIST;
        case NLE_OBJ_NOTFOUND: return -ESRCH;
        case NLE_NODEV:        return -ENODEV;
        case NLE_NOADDR:       return -EADDRNOTAVAIL;
        case NLE_PERM:         return -EPERM;
        case NLE_NOACCESS:     return -EACCES;
        case NLE_NOMEM:        return -ENOMEM;
        case NLE_INVAL:        return -EINVAL;
        case NLE_BUSY:         return -EBUSY;
        case NLE_RANGE:        return -ERANGE;
        case NLE_AGAIN:        return -EAGAIN;
        case NLE_OPNOTSUPP:    return -EOPNOTSUPP;
        default:               return -EIO;
    }
}

rtnl_route *NetlinkBackend::BuildRoute_(const Routing::Route &r,
                                        int                  &rc)
{
    const unsigned ifindex = ::if_nametoindex(r.dev.c_str());
    if (ifindex == 0)
    {
        rc = -ENODEV;
        return nullptr;
    }

    rtnl_route *route = rtnl_route_alloc();
    if (!route)
    {
        rc = -ENOMEM;
        return nullptr;
    }

    rtnl_route_set_family(route, AF_INET);
    rtnl_route_set_table(route, r.table);
    rtnl_route_set_protocol(route, RTPROT_BOOT);
    if (r.type == Routing::RouteType::Local)
    {
        rtnl_route_set_type(route, RTN_LOCAL);
        rtnl_route_set_scope(route, RT_SCOPE_HOST);
    }
    else
    {
        rtnl_route_set_type(route, RTN_UNICAST);
        rtnl_route_set_scope(route, RT_SCOPE_LINK);
    }

    nl_addr *dst = BuildAddr4(r.dst);
    if (!dst)
    {
        rtnl_route_put(route);
        rc = -ENOMEM;
        return nullptr;
    }
    rtnl_route_set_dst(route, dst);
    nl_addr_put(dst); // route держит свою ссылку

    rtnl_nexthop *nh = rtnl_route_nh_alloc();
    if (!nh)
    {
        rtnl_route_put(route);
        rc = -ENOMEM;
        return nullptr;
    }
    rtnl_route_nh_set_ifindex(nh, static_cast<int>(ifindex));
    rtnl_route_add_nexthop(route, nh);

    rc = 0;
    return route;
}

int NetlinkBackend::RouteAdd(const Routing::Route &r)
{
    int rc = 0;
    rtnl_route *route = BuildRoute_(r, rc);
    if (!route)
    {
        return rc;
    }

    rc = ToErrno_(rtnl_route_add(sk_, route, NLM_F_CREATE | NLM_F_EXCL));
    rtnl_route_put(route);
    return rc;
}

int NetlinkBackend::RouteDelete(const Routing::Route &r)
{
    int rc = 0;
    rtnl_route *route = BuildRoute_(r, rc);
    if (!route)
    {
        // Нет устройства — нет и маршрута через него.
        return rc;
    }

    rc = ToErrno_(rtnl_route_delete(sk_, route, 0));
    rtnl_route_put(route);
    return rc;
}

int NetlinkBackend::RouteList(std::uint32_t                table,
                              std::vector<Routing::Route> &out)
{
    out.clear();

    nl_cache *cache = nullptr;
    const int err = rtnl_route_alloc_cache(sk_, AF_INET, 0, &cache);
    if (err < 0)
    {
        return ToErrno_(err);
    }

    for (nl_object *it = nl_cache_get_first(cache);
         it;
         it = nl_cache_get_next(it))
    {
        auto *r = reinterpret_cast<rtnl_route *>(it);
        if (rtnl_route_get_table(r) != table) continue;

        Routing::Route route;
        route.table = table;

        const auto type = rtnl_route_get_type(r);
        if (type == RTN_LOCAL)        route.type = Routing::RouteType::Local;
        else if (type == RTN_UNICAST) route.type = Routing::RouteType::Unicast;
        else                          continue;

        route.dst = FromNlAddr(rtnl_route_get_dst(r));
        if (rtnl_route_get_nnexthops(r) > 0)
        {
            rtnl_nexthop *nh = rtnl_route_nexthop_n(r, 0);
            if (nh)
            {
                route.dev = IndexToName(rtnl_route_nh_get_ifindex(nh));
            }
        }
        out.push_back(route);
    }

    nl_cache_free(cache);
    return 0;
}

int NetlinkBackend::RuleAdd(const Routing::Rule &r)
{
    rtnl_rule *rule = rtnl_rule_alloc();
    if (!rule)
    {
        return -ENOMEM;
    }

    rtnl_rule_set_family(rule, AF_INET);
    rtnl_rule_set_prio(rule, r.pref);
    rtnl_rule_set_mark(rule, r.fwmark);
    rtnl_rule_set_table(rule, r.table);
    rtnl_rule_set_action(rule, FR_ACT_TO_TBL);

    const int rc = ToErrno_(rtnl_rule_add(sk_, rule, NLM_F_CREATE));
    rtnl_rule_put(rule);
    return rc;
}

int NetlinkBackend::RuleDelete(std::uint32_t pref)
{
    rtnl_rule *rule = rtnl_rule_alloc();
    if (!rule)
    {
        return -ENOMEM;
    }

    // Только семейство и приоритет: ядро удалит первое совпавшее правило.
    rtnl_rule_set_family(rule, AF_INET);
    rtnl_rule_set_prio(rule, pref);

    const int rc = ToErrno_(rtnl_rule_delete(sk_, rule, 0));
    rtnl_rule_put(rule);
    return rc;
}

int NetlinkBackend::RuleList(std::vector<Routing::Rule> &out)
{
    out.clear();

    nl_cache *cache = nullptr;
    const int err = rtnl_rule_alloc_cache(sk_, AF_INET, &cache);
    if (err < 0)
    {
        return ToErrno_(err);
    }

    for (nl_object *it = nl_cache_get_first(cache);
         it;
         it = nl_cache_get_next(it))
    {
        auto *r = reinterpret_cast<rtnl_rule *>(it);

        Routing::Rule rule;
        rule.pref   = rtnl_rule_get_prio(r);
        rule.fwmark = rtnl_rule_get_mark(r);
        rule.table  = rtnl_rule_get_table(r);
        out.push_back(rule);
    }

    nl_cache_free(cache);
    return 0;
}

bool NetlinkBackend::LinkExists(const std::string &ifname)
{
    rtnl_link *link = nullptr;
    const int rc = rtnl_link_get_kernel(sk_, 0, ifname.c_str(), &link);
    if (rc < 0 || !link)
    {
        return false;
    }
    rtnl_link_put(link);
    return true;
}

int NetlinkBackend::LinkSetUp(const std::string &ifname)
{
    rtnl_link *orig = nullptr;
    int rc = rtnl_link_get_kernel(sk_, 0, ifname.c_str(), &orig);
    if (rc < 0)
    {
        return ToErrno_(rc);
    }

    rtnl_link *change = rtnl_link_alloc();
    if (!change)
    {
        rtnl_link_put(orig);
        return -ENOMEM;
    }
    rtnl_link_set_flags(change, IFF_UP);

    rc = ToErrno_(rtnl_link_change(sk_, orig, change, 0));

    rtnl_link_put(change);
    rtnl_link_put(orig);
    return rc;
}

int NetlinkBackend::AddrAdd(const std::string       &ifname,
                            const NetConfig::CidrV4 &addr)
{
    const unsigned ifindex = ::if_nametoindex(ifname.c_str());
    if (ifindex == 0)
    {
        return -ENODEV;
    }

    rtnl_addr *a = rtnl_addr_alloc();
    if (!a) return -ENOMEM;
    rtnl_addr_set_ifindex(a, static_cast<int>(ifindex));
    rtnl_addr_set_family(a, AF_INET);

    nl_addr *l = nl_addr_build(AF_INET, &addr.addr_be, sizeof(addr.addr_be));
    if (!l)
    {
        rtnl_addr_put(a);
        return -ENOMEM;
    }

    rtnl_addr_set_local(a, l);
    rtnl_addr_set_prefixlen(a, addr.prefix);

    const int rc = ToErrno_(rtnl_addr_add(sk_, a, 0));

    nl_addr_put(l);
    rtnl_addr_put(a);
    return rc;
}

std::optional<std::string> NetlinkBackend::DefaultRouteIfname()
{
    nl_cache *rcache = nullptr;
    if (rtnl_route_alloc_cache(sk_, AF_INET, 0, &rcache) < 0)
    {
        return std::nullopt;
    }

    int oif = 0;
    for (nl_object *it = nl_cache_get_first(rcache);
         it;
         it = nl_cache_get_next(it))
    {
        auto *r = reinterpret_cast<rtnl_route *>(it);
        nl_addr *dst = rtnl_route_get_dst(r);
        const bool is_default =
                (dst == nullptr) || (nl_addr_get_prefixlen(dst) == 0);
        if (!is_default) continue;
        if (rtnl_route_get_table(r) != RT_TABLE_MAIN) continue;

        if (rtnl_route_get_nnexthops(r) > 0)
        {
            rtnl_nexthop *nh = rtnl_route_nexthop_n(r, 0);
            if (nh)
            {
                oif = rtnl_route_nh_get_ifindex(nh);
                if (oif > 0) break;
            }
        }
    }
    nl_cache_free(rcache);

    std::string name = IndexToName(oif);
    if (name.empty()) return std::nullopt;
    return name;
}

std::optional<NetConfig::CidrV4> NetlinkBackend::PrimaryAddr(const std::string &ifname)
{
    const unsigned ifindex = ::if_nametoindex(ifname.c_str());
    if (ifindex == 0)
    {
        return std::nullopt;
    }

    nl_cache *cache = nullptr;
    if (rtnl_addr_alloc_cache(sk_, &cache) < 0)
    {
        return std::nullopt;
    }

    std::optional<NetConfig::CidrV4> found;
    for (nl_object *it = nl_cache_get_first(cache);
         it;
         it = nl_cache_get_next(it))
    {
        auto *a = reinterpret_cast<rtnl_addr *>(it);
        if (rtnl_addr_get_ifindex(a) != static_cast<int>(ifindex)) continue;
        if (rtnl_addr_get_family(a) != AF_INET) continue;
        if (rtnl_addr_get_scope(a) != RT_SCOPE_UNIVERSE) continue;
        if (rtnl_addr_get_flags(a) & IFA_F_SECONDARY) continue;

        NetConfig::CidrV4 c = FromNlAddr(rtnl_addr_get_local(a));
        c.prefix = static_cast<std::uint8_t>(rtnl_addr_get_prefixlen(a));
        found = c;
        break;
    }

    nl_cache_free(cache);
    return found;
}
