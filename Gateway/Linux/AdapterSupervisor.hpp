#pragma once

#include "RoutingBackend.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

/**
 * @file AdapterSupervisor.hpp
 * @brief Запуск и надзор за процессом SOCKS5-to-TUN адаптера (tun2socks).
 *
 * Состояния: Starting -> Running -> Terminating -> Exited.
 * Процесс принадлежит только супервизору: сигналы ему шлёт только он.
 * Деструктор не оставляет сирот: живой процесс добивается SIGKILL и собирается.
 */
class AdapterSupervisor
{
public:
    enum class State
    {
        Idle,        ///< Ещё не запускался.
        Starting,    ///< Процесс создан, интерфейс ещё не поднят.
        Running,     ///< Интерфейс поднят и адресован.
        Terminating, ///< Отправлен SIGTERM, ждём выхода.
        Exited       ///< Процесс собран (waitpid).
    };

    struct Params
    {
        std::vector<std::string>  argv;          ///< argv[0] — исполняемый файл (ищется в PATH).
        std::string               device = "tun0";
        NetConfig::CidrV4         device_addr {};
        std::chrono::milliseconds ready_timeout { 10000 };
        std::chrono::milliseconds poll_interval { 100 };
    };

    /**
     * @brief argv для tun2socks: <bin> -device tun://<dev> -proxy <proxy>.
     */
    static std::vector<std::string> BuildArgv(const std::string &binary,
                                              const std::string &device,
                                              const std::string &proxy);

    explicit AdapterSupervisor(Params params);
    ~AdapterSupervisor();

    AdapterSupervisor(const AdapterSupervisor &) = delete;
    AdapterSupervisor &operator=(const AdapterSupervisor &) = delete;

    /**
     * @brief fork/exec адаптера.
     * @throws AdapterSpawnError если fork() или exec() не удались.
     */
    void Spawn();

    /**
     * @brief Ждёт появления интерфейса в ядре (опрос с интервалом poll_interval).
     * @throws AdapterSpawnError по таймауту.
     * @throws AdapterCrashError если адаптер завершился раньше.
     */
    void WaitReady(Routing::Backend &backend);

    /**
     * @brief Поднимает интерфейс и назначает ему адрес. Переход в Running.
     * @throws AdapterSpawnError при ошибке netlink.
     */
    void BringUp(Routing::Backend &backend);

    /**
     * @brief Отправляет SIGTERM (один раз).
     * @return true, если сигнал отправлен сейчас; false — уже отправлялся или процесс мёртв.
     */
    bool RequestStop();

    /**
     * @brief Неблокирующий waitpid.
     * @return true, если процесс завершён (сейчас или ранее).
     */
    bool TryReap();

    /// SIGKILL и блокирующий waitpid.
    void Kill() noexcept;

    State       GetState() const { return state_; }
    pid_t       Pid() const { return pid_; }
    bool        StopRequested() const { return stop_requested_; }
    int         RawStatus() const { return status_; }
    const std::string &Device() const { return params_.device; }

    /// "exit code N" / "killed by signal NAME".
    std::string DescribeExit() const;

    static const char *StateName(State s);

private:
    Params      params_;
    pid_t       pid_            = -1;
    State       state_          = State::Idle;
    bool        stop_requested_ = false;
    int         status_         = 0;

    void SetState_(State s);
};
