#pragma once

#include "PacketFilter.hpp"
#include "RoutingBackend.hpp"

#include <cstdint>
#include <optional>
#include <string>

/**
 * @file RedirectRollback.hpp
 * @brief RAII-откат состояния перенаправления.
 *
 * В конструкторе делает снимок net.ipv4.ip_forward.
 * В деструкторе (если не вызван Dismiss()):
 *  - удаляет правило и маршруты нашей таблицы, если был MarkRoutingApplied();
 *  - очищает цепочку маркировки, если был MarkFilterApplied();
 *  - восстанавливает ip_forward.
 * Этапы, до которых настройка не дошла, не трогаются.
 *
 * Использование:
 *  RedirectRollback rb(routing, &filter, params);
 *  rb.MarkRoutingApplied();
 *  RoutingTable::ResetRoutes(...);
 *  PacketMark::Install(...);
 *  rb.MarkFilterApplied();
 */
class RedirectRollback
{
public:
    struct Params
    {
        std::uint32_t table              = 200;
        std::uint32_t rule_pref          = 99;
        std::string   mark_table         = "mangle";
        std::string   mark_chain         = "PREROUTING";
        bool          restore_ip_forward = true;
    };

    /**
     * @param filter Может быть nullptr: цепочка маркировки не трогается.
     */
    RedirectRollback(Routing::Backend      &routing,
                     PacketFilter::Backend *filter,
                     Params                 params);

    /// Идемпотентен, никогда не бросает.
    ~RedirectRollback();

    RedirectRollback(const RedirectRollback &) = delete;
    RedirectRollback &operator=(const RedirectRollback &) = delete;

    /// Маршруты/правило таблицы меняются: снимать их при откате.
    void MarkRoutingApplied() noexcept { routing_applied_ = true; }

    /// Правило маркировки установлено: очищать цепочку при откате.
    void MarkFilterApplied() noexcept { filter_applied_ = true; }

    /// Отказ от отката: состояние остаётся в системе.
    void Dismiss() noexcept;

    /// Выполнить откат сейчас (повторный вызов ничего не делает).
    bool Restore() noexcept;

    /// Снимок ip_forward сделан (или не требовался).
    bool Ok() const { return ok_; }

private:
    Routing::Backend          &routing_;
    PacketFilter::Backend     *filter_;
    Params                     params_;
    std::optional<std::string> ip_forward_prev_;
    bool                       ok_              = false;
    bool                       done_            = false;
    bool                       routing_applied_ = false;
    bool                       filter_applied_  = false;
};
