#include "PacketMark.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

namespace PacketMark
{
    void Install(PacketFilter::Backend   &backend,
                 const std::string       &table,
                 const std::string       &chain,
                 const std::string       &iface,
                 const NetConfig::CidrV4 &lan,
                 std::uint32_t            exclude_addr_be,
                 std::uint32_t            mark)
    {
        PacketFilter::MarkRule rule;
        rule.iifname          = iface;
        rule.saddr            = NetConfig::to_network(lan);
        rule.exclude_daddr_be = exclude_addr_be;
        rule.mark             = mark;

        if (!backend.EnsureChain(table, chain))
        {
            throw PacketFilterError("cannot create " + table + "/" + chain + ": " + backend.LastError());
        }

        LOGI("mark") << "flushing " << table << "/" << chain << " (all rules in the chain are removed)";
        if (!backend.FlushChain(table, chain))
        {
            throw PacketFilterError("cannot flush " + table + "/" + chain + ": " + backend.LastError());
        }

        if (!backend.AppendMarkRule(table, chain, rule))
        {
            throw PacketFilterError("cannot add mark rule to " + table + "/" + chain + ": " + backend.LastError());
        }

        LOGI("mark") << table << "/" << chain << ": iif " << iface
                     << " saddr " << NetConfig::to_string(rule.saddr)
                     << " daddr != " << NetConfig::ipv4_to_string(exclude_addr_be)
                     << " -> mark 0x" << std::hex << mark << std::dec;
    }

    void Install(PacketFilter::Backend   &backend,
                 const std::string       &iface,
                 const NetConfig::CidrV4 &lan,
                 std::uint32_t            exclude_addr_be,
                 std::uint32_t            mark)
    {
        Install(backend, kTable, kChain, iface, lan, exclude_addr_be, mark);
    }

    bool Remove(PacketFilter::Backend &backend,
                const std::string     &table,
                const std::string     &chain) noexcept
    {
        if (!backend.FlushChain(table, chain))
        {
            LOGW("mark") << "teardown: flush " << table << "/" << chain << " failed: " << backend.LastError();
            return false;
        }
        LOGI("mark") << "teardown: " << table << "/" << chain << " flushed";
        return true;
    }
} // namespace PacketMark
