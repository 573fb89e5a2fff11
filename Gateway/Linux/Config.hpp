#pragma once

#include "Network.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <string>

#include <arpa/inet.h>

namespace Routing
{
    class Backend;
}

namespace Config
{
    /// Путь к env-файлу по умолчанию.
    inline constexpr const char *kDefaultEnvFile = "/etc/tunredirect/tunredirect.env";

    enum class Mode
    {
        Tun,   ///< Полный цикл: маркировка + адаптер tun2socks + маршруты через TUN.
        TProxy ///< Только таблица и правило (local default через lo), без адаптера.
    };

    /// Набор KEY=value (из окружения процесса или из файла).
    using Values = std::map<std::string, std::string>;

    /**
     * @brief Итоговая неизменяемая конфигурация.
     * @details Значения по умолчанию — инициализаторы полей.
     */
    struct Settings
    {
        std::string       iface       = "eth0";
        NetConfig::CidrV4 lan         { inet_addr("192.168.0.0"), 24 };
        std::uint32_t     addr_be     = inet_addr("192.168.0.254"); ///< Исключается из маркировки.
        std::uint32_t     mark        = 0x2;
        std::uint32_t     table       = 200;
        std::uint32_t     rule_pref   = 99;
        std::string       table_name  = "tproxy";
        std::string       registry    = "/etc/iproute2/rt_tables";
        Mode              mode        = Mode::Tun;

        std::string       tun_device  = "tun0";
        NetConfig::CidrV4 tun_addr    { inet_addr("127.0.254.1"), 32 };
        std::string       proxy       = "socks5://127.0.0.1:1080";
        std::string       adapter_bin = "/usr/local/bin/tun2socks";

        std::chrono::milliseconds ready_timeout { 10000 };
        std::chrono::milliseconds stop_timeout  { 5000 };

        bool              keep_state  = false;
        bool              ip_forward  = true;

        std::string       log_level   = "info";
        std::string       log_dir;
        bool              log_syslog  = false;

        // "auto" в IFACE/LAN/ADDR: значение вычисляется ResolveAuto().
        bool              iface_auto  = false;
        bool              lan_auto    = false;
        bool              addr_auto   = false;
    };

    /// Все распознаваемые ключи.
    const char *const *KnownKeys();

    /**
     * @brief Разбирает env-текст: KEY=value, "export KEY=value", комментарии '#',
     *        значения в одинарных/двойных кавычках.
     */
    Values ParseEnvText(std::istream &in);

    /**
     * @brief Читает env-файл.
     * @return Пустой набор, если файла нет.
     * @throws ConfigError если файл есть, но не читается.
     */
    Values ParseEnvFile(const std::string &path);

    /**
     * @brief Выбирает из окружения процесса только известные ключи.
     * @param envp Массив "KEY=value" (как environ), завершённый nullptr.
     */
    Values CaptureEnvironment(char **envp);

    /**
     * @brief Строит Settings: значения по умолчанию, затем values поверх.
     * @throws ConfigError при неверных значениях.
     */
    Settings Build(const Values &values);

    /**
     * @brief Полное разрешение: умолчания < окружение процесса < env-файл.
     * @throws ConfigError
     */
    Settings Resolve(const std::string &env_file, const Values &process_env);

    /**
     * @brief Подставляет значения для "auto" через маршрутизацию ядра.
     * @throws ConfigError если интерфейс/адрес определить не удалось.
     */
    Settings ResolveAuto(const Settings &in, Routing::Backend &backend);

    /// Однострочное описание конфигурации для лога.
    std::string Summary(const Settings &s);

    const char *ModeName(Mode m);
} // namespace Config
