#pragma once

#include "Config.hpp"
#include "Lifecycle.hpp"
#include "PacketFilter.hpp"
#include "RoutingBackend.hpp"

/**
 * @file Gateway.hpp
 * @brief Последовательность настройки перенаправления и коды выхода.
 *
 * Порядок шагов строгий: таблица -> маршруты -> правило -> маркировка ->
 * адаптер -> маршруты через TUN. Ошибка любого шага фатальна
 * (исключение RedirectError с именем этапа).
 */
namespace Gateway
{
    enum ExitCode : int
    {
        kExitClean        = 0,
        kExitSetupFailure = 1,
        kExitAdapterCrash = 2
    };

    /**
     * @brief Регистрирует таблицу и приводит маршруты/правило к эталону.
     * @throws RegistryIOError, RouteInstallError
     */
    void SetupRouting(const Config::Settings &s, Routing::Backend &routing);

    /**
     * @brief Полный запуск в выбранном режиме.
     *
     * tproxy: только SetupRouting(), сразу kExitClean, состояние остаётся.
     * tun: маркировка, адаптер, ожидание через lifecycle; при выходе
     *      (если KEEP_STATE=0) состояние снимается.
     *
     * @return kExitClean или kExitAdapterCrash.
     * @throws RedirectError при сбое настройки.
     */
    int Run(const Config::Settings &settings,
            Routing::Backend       &routing,
            PacketFilter::Backend  &filter,
            Lifecycle              &lifecycle);

    /**
     * @brief Явный демонтаж: правило, маршруты таблицы, цепочка маркировки.
     * @return true если всё снято без ошибок.
     */
    bool Teardown(const Config::Settings &settings,
                  Routing::Backend       &routing,
                  PacketFilter::Backend  &filter) noexcept;
} // namespace Gateway
