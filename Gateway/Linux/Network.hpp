// Gateway/Linux/Network.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <netlink/netlink.h>
#include <netlink/socket.h>

namespace NetConfig
{
    /**
     * @brief CIDR блок IPv4.
     */
    struct CidrV4
    {
        std::uint32_t addr_be = 0; ///< Адрес в big-endian.
        std::uint8_t  prefix  = 32; ///< Длина префикса.

        bool operator==(const CidrV4 &o) const
        {
            return addr_be == o.addr_be && prefix == o.prefix;
        }
        bool operator!=(const CidrV4 &o) const
        {
            return !(*this == o);
        }
    };

    /**
     * @brief Разобрать IPv4 адрес без префикса.
     * @param s Строка "A.B.C.D".
     * @param out_be Адрес в big-endian.
     * @return true при успехе.
     */
    bool parse_ipv4(const std::string &s, std::uint32_t &out_be);

    /**
     * @brief Разобрать строку IPv4 CIDR в структуру CidrV4.
     * @param s Строка формата "A.B.C.D/len". Если "/len" опущен, берётся 32.
     * @param out Куда записать адрес/префикс.
     * @return true при успехе.
     */
    bool parse_cidr4(const std::string &s, CidrV4 &out);

    /// Маска префикса в big-endian (prefix=0 -> 0).
    std::uint32_t prefix_mask_be(std::uint8_t prefix);

    /// CIDR с обнулёнными хостовыми битами.
    CidrV4 to_network(const CidrV4 &c);

    /**
     * @brief Вернуть строку сети вида "A.B.C.D/p" (обнуляя хостовые биты).
     */
    std::string to_network_cidr(const CidrV4 &c);

    /// "A.B.C.D/p" без обнуления хостовых битов.
    std::string to_string(const CidrV4 &c);

    /// "A.B.C.D".
    std::string ipv4_to_string(std::uint32_t addr_be);

    /// Принадлежит ли адрес сети.
    bool contains(const CidrV4 &net, std::uint32_t addr_be);

    /**
     * @brief Читает значение sysctl по dotted-имени ("net.ipv4.ip_forward").
     * @return Значение без завершающих пробелов/переводов строки либо std::nullopt.
     */
    std::optional<std::string> read_sysctl(const std::string &dotted);

    /**
     * @brief Записывает значение sysctl по dotted-имени.
     * @return true при успехе.
     */
    bool write_sysctl(const std::string &dotted, const std::string &val);

    /**
     * @brief Создаёт и подключает NETLINK_ROUTE сокет.
     * @return nl_sock* при успехе, nullptr при ошибке.
     */
    nl_sock *nl_connect_route();
} // namespace NetConfig
