#pragma once

#include "PacketFilter.hpp"

#include <cstdint>
#include <string>

/**
 * @file PacketMark.hpp
 * @brief Установка единственного правила маркировки LAN-трафика.
 *
 * Перед добавлением цепочка очищается целиком: после любого числа
 * перезапусков в ней остаётся ровно одно правило. Посторонние правила
 * в этой цепочке тоже удаляются.
 */
namespace PacketMark
{
    inline constexpr const char *kTable = "mangle";
    inline constexpr const char *kChain = "PREROUTING";

    /**
     * @brief Очищает цепочку и добавляет правило
     *        iif <iface>, saddr <lan>, daddr != <exclude>, mark <mark>.
     * @throws PacketFilterError при любой ошибке.
     */
    void Install(PacketFilter::Backend   &backend,
                 const std::string       &table,
                 const std::string       &chain,
                 const std::string       &iface,
                 const NetConfig::CidrV4 &lan,
                 std::uint32_t            exclude_addr_be,
                 std::uint32_t            mark);

    /// Install() с таблицей "mangle" и цепочкой "PREROUTING".
    void Install(PacketFilter::Backend   &backend,
                 const std::string       &iface,
                 const NetConfig::CidrV4 &lan,
                 std::uint32_t            exclude_addr_be,
                 std::uint32_t            mark);

    /**
     * @brief Очищает цепочку маркировки.
     * @return true при успехе. Не бросает.
     */
    bool Remove(PacketFilter::Backend &backend,
                const std::string     &table = kTable,
                const std::string     &chain = kChain) noexcept;
} // namespace PacketMark
