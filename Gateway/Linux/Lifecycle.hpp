#pragma once

#include "AdapterSupervisor.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>

/**
 * @file Lifecycle.hpp
 * @brief Ожидание "что случится раньше": сигнал завершения или выход адаптера.
 *
 * signal_set (SIGINT, SIGTERM, SIGCHLD) регистрируется в конструкторе,
 * до любых шагов настройки: сигнал, пришедший во время настройки,
 * ставится в очередь и обрабатывается в Run().
 */
class Lifecycle
{
public:
    enum class Outcome
    {
        Clean,         ///< Остановлен по сигналу (в т.ч. через SIGKILL по таймауту).
        AdapterCrashed ///< Адаптер завершился сам.
    };

    explicit Lifecycle(std::chrono::milliseconds stop_timeout);
    ~Lifecycle();

    Lifecycle(const Lifecycle &) = delete;
    Lifecycle &operator=(const Lifecycle &) = delete;

    /**
     * @brief Блокирует поток до завершения адаптера.
     *
     * Первый SIGINT/SIGTERM: SIGTERM адаптеру и таймер stop_timeout.
     * Повторные сигналы только логируются. По таймеру — SIGKILL.
     * Возврат всегда с собранным (waitpid) процессом.
     */
    Outcome Run(AdapterSupervisor &supervisor);

    /// Номер первого полученного сигнала завершения (0 — не было).
    int TerminationSignal() const { return term_signal_; }

    static const char *OutcomeName(Outcome o);

private:
    boost::asio::io_context   io_;
    boost::asio::signal_set   signals_;
    boost::asio::steady_timer stop_timer_;
    std::chrono::milliseconds stop_timeout_;

    AdapterSupervisor *supervisor_  = nullptr;
    Outcome            outcome_     = Outcome::Clean;
    bool               done_        = false;
    int                term_signal_ = 0;

    void WaitSignal_();
    void OnSignal_(int signo);
    void OnStopTimeout_();
    void CheckChild_();
    void Finish_(Outcome o);
};
