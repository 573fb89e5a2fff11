#include "PacketFilter.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>

#include <nftables/libnftables.h>

namespace PacketFilter
{
    namespace
    {
        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string MarkHex(std::uint32_t mark)
        {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "0x%08x", mark);
            return buf;
        }
    }

    bool Matches(const MarkRule &rule,
                 const Packet   &pkt)
    {
        if (!rule.iifname.empty() && pkt.iifname != rule.iifname)
        {
            return false;
        }
        if (!NetConfig::contains(rule.saddr, pkt.saddr_be))
        {
            return false;
        }
        return pkt.daddr_be != rule.exclude_daddr_be;
    }

    std::optional<std::uint32_t> Classify(const std::vector<MarkRule> &chain,
                                          const Packet                &pkt)
    {
        std::optional<std::uint32_t> mark;
        for (const auto &r : chain)
        {
            if (Matches(r, pkt))
            {
                mark = r.mark;
            }
        }
        return mark;
    }

    std::string RenderNftRule(const std::string &table,
                              const std::string &chain,
                              const MarkRule    &rule)
    {
        std::string cmd = "add rule ip " + table + " " + chain + " ";
        cmd += "iifname \"" + rule.iifname + "\" ";
        cmd += "ip saddr " + NetConfig::to_network_cidr(rule.saddr) + " ";
        cmd += "ip daddr != " + NetConfig::ipv4_to_string(rule.exclude_daddr_be) + " ";
        cmd += "counter meta mark set " + MarkHex(rule.mark) + " ";
        cmd += "comment \"tunredirect\"\n";
        return cmd;
    }

    bool NftBackend::Apply(const std::string &commands)
    {
        nft_ctx *ctx = nft_ctx_new(NFT_CTX_DEFAULT);
        if (!ctx)
        {
            last_error_ = "nft_ctx_new failed";
            return false;
        }

        nft_ctx_buffer_output(ctx);
        nft_ctx_buffer_error(ctx);

        const int rc = nft_run_cmd_from_buffer(ctx, commands.c_str());
        if (rc != 0)
        {
            const char *err = nft_ctx_get_error_buffer(ctx);
            const std::string e = Lower(err ? err : "");
            const std::string c = Lower(commands);

            bool benign = false;
            // 1) идемпотентность: "exists"/"already" при add
            if (c.rfind("add ", 0) == 0 &&
                (e.find("exist") != std::string::npos || e.find("already") != std::string::npos))
            {
                benign = true;
            }
            // 2) flush/delete несуществующего объекта
            if (!benign && e.find("no such file or directory") != std::string::npos &&
                (c.find("delete ") != std::string::npos || c.find("flush chain") != std::string::npos))
            {
                benign = true;
            }

            if (!benign)
            {
                last_error_ = err ? err : "(no error text)";
                LOGE("nft") << "ERROR: " << last_error_;
                LOGD("nft") << "COMMANDS:\n" << commands;
            }
            else
            {
                LOGD("nft") << "benign failure ignored: " << (err ? err : "");
            }
            nft_ctx_free(ctx);
            return benign;
        }

        nft_ctx_free(ctx);
        return true;
    }

    bool NftBackend::EnsureChain(const std::string &table,
                                 const std::string &chain)
    {
        // Раздельно: "exists" на таблице не должен обрывать создание цепочки.
        if (!Apply("add table ip " + table + "\n"))
        {
            return false;
        }
        return Apply("add chain ip " + table + " " + chain +
                     " { type filter hook prerouting priority -150; policy accept; }\n");
    }

    bool NftBackend::FlushChain(const std::string &table,
                                const std::string &chain)
    {
        return Apply("flush chain ip " + table + " " + chain + "\n");
    }

    bool NftBackend::AppendMarkRule(const std::string &table,
                                    const std::string &chain,
                                    const MarkRule    &rule)
    {
        return Apply(RenderNftRule(table, chain, rule));
    }

    std::string NftBackend::LastError() const
    {
        return last_error_;
    }

    bool nft_feature_probe()
    {
        nft_ctx *ctx = nft_ctx_new(NFT_CTX_DEFAULT);
        if (!ctx) return false;
        nft_ctx_buffer_output(ctx);
        nft_ctx_buffer_error(ctx);

        const int rc = nft_run_cmd_from_buffer(ctx, "list tables");

        nft_ctx_free(ctx);
        return rc == 0;
    }
} // namespace PacketFilter
