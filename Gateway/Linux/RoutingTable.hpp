#pragma once

#include "RoutingBackend.hpp"

#include <cstdint>
#include <optional>
#include <string>

/**
 * @file RoutingTable.hpp
 * @brief Управление выделенной таблицей policy routing и fwmark-правилом.
 *
 * Таблица целиком принадлежит этому модулю: маршруты в ней пересоздаются
 * при каждом запуске (удалить, затем добавить), правило ставится последним,
 * чтобы трафик не уходил в недонастроенную таблицу.
 */
namespace RoutingTable
{
    /**
     * @brief Ищет запись "<id> <name>" в тексте реестра (/etc/iproute2/rt_tables).
     * @return Имя таблицы, если id найден первым токеном строки.
     */
    std::optional<std::string> RegistryLookup(const std::string &content, std::uint32_t id);

    /**
     * @brief Регистрирует таблицу в реестре имён, если её там нет.
     *
     * Создаёт каталог и файл при отсутствии. Файл только дополняется,
     * существующие строки не трогаются. Повторный вызов ничего не меняет.
     *
     * @throws RegistryIOError при ошибке чтения/записи.
     */
    void EnsureTable(const std::string &registry_path,
                     std::uint32_t      id,
                     const std::string &name);

    /**
     * @brief Пересоздаёт маршруты таблицы и fwmark-правило.
     *
     * Удаляет (best-effort): local 0.0.0.0/0 dev lo, <lan> dev <iface>,
     * все правила с приоритетом pref. Затем добавляет: local 0.0.0.0/0 dev lo,
     * <lan> dev <iface>, правило pref -> fwmark -> table.
     *
     * @throws RouteInstallError при ошибке, отличной от "уже нет"/"уже есть такое же".
     */
    void ResetRoutes(Routing::Backend        &backend,
                     std::uint32_t            table,
                     const NetConfig::CidrV4 &lan,
                     const std::string       &iface,
                     std::uint32_t            pref,
                     std::uint32_t            mark);

    /**
     * @brief Переводит таблицу на TUN: default dev <tun> вместо local default,
     *        плюс 127.0.0.1/32 dev lo.
     * @throws RouteInstallError
     */
    void BindTunnelRoutes(Routing::Backend  &backend,
                          std::uint32_t      table,
                          const std::string &tun);

    /**
     * @brief Снимает правила с приоритетом pref и все маршруты таблицы.
     * @return true, если всё удалено без ошибок. Не бросает.
     */
    bool Teardown(Routing::Backend &backend,
                  std::uint32_t     table,
                  std::uint32_t     pref) noexcept;

    /// Маршрут "local 0.0.0.0/0 dev lo table <table>".
    Routing::Route LocalDefault(std::uint32_t table);

    /// Маршрут "<lan> dev <iface> table <table>".
    Routing::Route LanRoute(std::uint32_t table, const NetConfig::CidrV4 &lan, const std::string &iface);
} // namespace RoutingTable
