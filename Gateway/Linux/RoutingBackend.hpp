#pragma once

#include "Network.hpp"

#include <cerrno>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file RoutingBackend.hpp
 * @brief Узкий интерфейс к маршрутизации ядра (маршруты, правила, линки, адреса).
 *
 * Все операции возвращают 0 при успехе или отрицательный errno:
 *  -EEXIST        — объект уже существует;
 *  -ESRCH/-ENOENT — удаляемого объекта нет;
 *  прочее         — реальная ошибка.
 * Рабочая реализация — NetlinkBackend (libnl-route-3), в тестах — fake в памяти.
 */
namespace Routing
{
    enum class RouteType
    {
        Unicast, ///< Обычный маршрут через устройство.
        Local    ///< "local" маршрут: доставка в локальный стек.
    };

    struct Route
    {
        RouteType          type  = RouteType::Unicast;
        NetConfig::CidrV4  dst   {};
        std::string        dev;
        std::uint32_t      table = 0;

        bool operator==(const Route &o) const
        {
            return type == o.type && dst == o.dst && dev == o.dev && table == o.table;
        }
    };

    /// Правило "pref N fwmark M lookup T".
    struct Rule
    {
        std::uint32_t pref   = 0;
        std::uint32_t fwmark = 0;
        std::uint32_t table  = 0;

        bool operator==(const Rule &o) const
        {
            return pref == o.pref && fwmark == o.fwmark && table == o.table;
        }
    };

    inline bool IsNotFound(int rc)
    {
        return rc == -ESRCH || rc == -ENOENT || rc == -ENODEV || rc == -EADDRNOTAVAIL;
    }

    inline bool IsExists(int rc)
    {
        return rc == -EEXIST;
    }

    class Backend
    {
    public:
        virtual ~Backend() = default;

        /// Добавить маршрут (без замены: повтор даёт -EEXIST).
        virtual int RouteAdd(const Route &r) = 0;

        /// Удалить маршрут по (type, dst, dev, table).
        virtual int RouteDelete(const Route &r) = 0;

        /// Все IPv4 маршруты таблицы.
        virtual int RouteList(std::uint32_t table, std::vector<Route> &out) = 0;

        /// Добавить правило (ядро допускает дубликаты — удаляйте заранее).
        virtual int RuleAdd(const Rule &r) = 0;

        /// Удалить одно IPv4 правило с данным приоритетом.
        virtual int RuleDelete(std::uint32_t pref) = 0;

        /// Все IPv4 правила.
        virtual int RuleList(std::vector<Rule> &out) = 0;

        virtual bool LinkExists(const std::string &ifname) = 0;

        /// Административно поднять интерфейс.
        virtual int LinkSetUp(const std::string &ifname) = 0;

        /// Добавить IPv4 адрес на интерфейс.
        virtual int AddrAdd(const std::string &ifname, const NetConfig::CidrV4 &addr) = 0;

        /// Интерфейс маршрута по умолчанию в таблице main.
        virtual std::optional<std::string> DefaultRouteIfname() = 0;

        /// Первый глобальный IPv4 адрес интерфейса (с префиксом).
        virtual std::optional<NetConfig::CidrV4> PrimaryAddr(const std::string &ifname) = 0;
    };

    /// Человекочитаемое описание маршрута для логов/ошибок.
    std::string Describe(const Route &r);

    /// Человекочитаемое описание правила.
    std::string Describe(const Rule &r);
} // namespace Routing
