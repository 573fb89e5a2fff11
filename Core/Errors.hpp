#pragma once

#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Типы фатальных ошибок этапов настройки перенаправления.
 *
 * Каждое исключение знает имя этапа, на котором произошёл сбой:
 * main() печатает "<stage> failed: <what>" и завершает процесс с ненулевым кодом.
 */

class RedirectError : public std::runtime_error
{
public:
    RedirectError(const char *stage, const std::string &what)
        : std::runtime_error(what)
        , stage_(stage)
    {
    }

    const char *Stage() const noexcept
    {
        return stage_;
    }

private:
    const char *stage_;
};

/// @brief Неверное или нечитаемое значение конфигурации.
class ConfigError : public RedirectError
{
public:
    explicit ConfigError(const std::string &what) : RedirectError("config", what) {}
};

/// @brief Реестр имён таблиц маршрутизации недоступен на чтение/запись.
class RegistryIOError : public RedirectError
{
public:
    explicit RegistryIOError(const std::string &what) : RedirectError("registry", what) {}
};

/// @brief Операция с маршрутом/правилом завершилась не "уже есть"/"уже нет".
class RouteInstallError : public RedirectError
{
public:
    explicit RouteInstallError(const std::string &what) : RedirectError("routing", what) {}
};

/// @brief Не удалось установить правило маркировки пакетов.
class PacketFilterError : public RedirectError
{
public:
    explicit PacketFilterError(const std::string &what) : RedirectError("packet-mark", what) {}
};

/// @brief Процесс адаптера не стартовал (или не создал интерфейс).
class AdapterSpawnError : public RedirectError
{
public:
    explicit AdapterSpawnError(const std::string &what) : RedirectError("adapter-spawn", what) {}
};

/// @brief Процесс адаптера завершился сам, пока ожидалась его работа.
class AdapterCrashError : public RedirectError
{
public:
    explicit AdapterCrashError(const std::string &what) : RedirectError("adapter", what) {}
};
