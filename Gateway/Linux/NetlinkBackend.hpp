#pragma once

#include "RoutingBackend.hpp"

#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/route/route.h>

/**
 * @file NetlinkBackend.hpp
 * @brief Routing::Backend поверх libnl-route-3 (NETLINK_ROUTE).
 *
 * Владеет одним netlink-сокетом на всё время жизни.
 * Коды libnl (-NLE_*) переводятся в отрицательный errno.
 */
class NetlinkBackend final : public Routing::Backend
{
public:
    /**
     * @brief Открывает NETLINK_ROUTE сокет.
     * @throws RouteInstallError если сокет не создаётся.
     */
    NetlinkBackend();
    ~NetlinkBackend() override;

    NetlinkBackend(const NetlinkBackend &) = delete;
    NetlinkBackend &operator=(const NetlinkBackend &) = delete;

    int RouteAdd(const Routing::Route &r) override;
    int RouteDelete(const Routing::Route &r) override;
    int RouteList(std::uint32_t table, std::vector<Routing::Route> &out) override;

    int RuleAdd(const Routing::Rule &r) override;
    int RuleDelete(std::uint32_t pref) override;
    int RuleList(std::vector<Routing::Rule> &out) override;

    bool LinkExists(const std::string &ifname) override;
    int  LinkSetUp(const std::string &ifname) override;
    int  AddrAdd(const std::string &ifname, const NetConfig::CidrV4 &addr) override;

    std::optional<std::string>       DefaultRouteIfname() override;
    std::optional<NetConfig::CidrV4> PrimaryAddr(const std::string &ifname) override;

private:
    nl_sock *sk_ = nullptr;

    /// Перевод -NLE_* в -errno.
    static int ToErrno_(int nl_rc);

    /**
     * @brief Собирает rtnl_route по описанию.
     * @return nullptr, если устройство не найдено или не хватило памяти (rc заполняется).
     */
    static rtnl_route *BuildRoute_(const Routing::Route &r, int &rc);
};
