#pragma once

#include "Network.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file PacketFilter.hpp
 * @brief Узкий интерфейс к пакетному фильтру ядра: цепочки и правило маркировки.
 *
 * Рабочая реализация — NftBackend (libnftables). Таблица/цепочка задаются
 * именами в стиле iptables ("mangle"/"PREROUTING"): iptables-nft хранит их
 * в nftables как "table ip mangle" и "chain PREROUTING".
 */
namespace PacketFilter
{
    /**
     * @brief Правило маркировки:
     *        iifname <iif> ip saddr <src> ip daddr != <exclude> -> meta mark set <mark>.
     */
    struct MarkRule
    {
        std::string       iifname;
        NetConfig::CidrV4 saddr {};
        std::uint32_t     exclude_daddr_be = 0;
        std::uint32_t     mark = 0;

        bool operator==(const MarkRule &o) const
        {
            return iifname == o.iifname && saddr == o.saddr &&
                   exclude_daddr_be == o.exclude_daddr_be && mark == o.mark;
        }
    };

    /// Описание входящего пакета для проверки правил без ядра.
    struct Packet
    {
        std::string   iifname;
        std::uint32_t saddr_be = 0;
        std::uint32_t daddr_be = 0;
    };

    /// Совпадает ли пакет с правилом.
    bool Matches(const MarkRule &rule, const Packet &pkt);

    /**
     * @brief Метка, которую получит пакет после прохода цепочки.
     * @details MARK не терминальный: при нескольких совпадениях побеждает последнее.
     * @return std::nullopt, если ни одно правило не сработало.
     */
    std::optional<std::uint32_t> Classify(const std::vector<MarkRule> &chain,
                                          const Packet                &pkt);

    /**
     * @brief nft-команда добавления правила в конец цепочки.
     * Пример: add rule ip mangle PREROUTING iifname "eth0" ip saddr 192.168.0.0/24
     *         ip daddr != 192.168.0.254 counter meta mark set 0x00000002 comment "tunredirect"
     */
    std::string RenderNftRule(const std::string &table,
                              const std::string &chain,
                              const MarkRule    &rule);

    class Backend
    {
    public:
        virtual ~Backend() = default;

        /// Создать таблицу и базовую цепочку prerouting, если их нет.
        virtual bool EnsureChain(const std::string &table, const std::string &chain) = 0;

        /// Удалить все правила цепочки (включая чужие).
        virtual bool FlushChain(const std::string &table, const std::string &chain) = 0;

        /// Добавить правило маркировки в конец цепочки.
        virtual bool AppendMarkRule(const std::string &table,
                                    const std::string &chain,
                                    const MarkRule    &rule) = 0;

        /// Текст последней ошибки (для сообщений исключений).
        virtual std::string LastError() const = 0;
    };

    /**
     * @brief Backend поверх libnftables.
     */
    class NftBackend final : public Backend
    {
    public:
        bool EnsureChain(const std::string &table, const std::string &chain) override;
        bool FlushChain(const std::string &table, const std::string &chain) override;
        bool AppendMarkRule(const std::string &table,
                            const std::string &chain,
                            const MarkRule    &rule) override;
        std::string LastError() const override;

        /**
         * @brief Применяет команды nftables.
         * @param commands Команды в виде строки.
         * @return true при успехе или если ошибка не критична ("exists" при add,
         *         "no such file" при flush/delete).
         */
        bool Apply(const std::string &commands);

    private:
        std::string last_error_;
    };

    /**
     * @brief Проверка доступности nftables в рантайме.
     * @return true если libnftables и ядро принимают команды.
     */
    bool nft_feature_probe();
} // namespace PacketFilter
