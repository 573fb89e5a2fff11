#include "Network.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <fcntl.h>
#include <unistd.h>

namespace NetConfig
{
    namespace
    {
        std::string ToProcSysPath(const std::string &dotted)
        {
            std::string p = "/proc/sys/";
            p.reserve(p.size() + dotted.size());
            for (char c : dotted)
            {
                p.push_back(c == '.' ? '/' : c);
            }
            return p;
        }
    }

    bool parse_ipv4(const std::string &s,
                    std::uint32_t     &out_be)
    {
        in_addr a{};
        if (::inet_pton(AF_INET, s.c_str(), &a) != 1)
        {
            return false;
        }
        out_be = a.s_addr;
        return true;
    }

    bool parse_cidr4(const std::string &s,
                     CidrV4            &out)
    {
        const auto slash = s.find('/');
        const std::string ip = s.substr(0, slash);

        std::uint32_t addr = 0;
        if (!parse_ipv4(ip, addr))
        {
            return false;
        }

        int prefix = 32;
        if (slash != std::string::npos)
        {
            const std::string p = s.substr(slash + 1);
            if (p.empty() || p.size() > 2 ||
                p.find_first_not_of("0123456789") != std::string::npos)
            {
                return false;
            }
            prefix = std::atoi(p.c_str());
            if (prefix < 0 || prefix > 32)
            {
                return false;
            }
        }

        out.addr_be = addr;
        out.prefix  = static_cast<std::uint8_t>(prefix);
        return true;
    }

    std::uint32_t prefix_mask_be(std::uint8_t prefix)
    {
        if (prefix == 0)
        {
            return 0;
        }
        const std::uint32_t host = prefix >= 32 ? 0xFFFFFFFFu : ~(0xFFFFFFFFu >> prefix);
        return htonl(host);
    }

    CidrV4 to_network(const CidrV4 &c)
    {
        CidrV4 n = c;
        n.addr_be &= prefix_mask_be(c.prefix);
        return n;
    }

    std::string ipv4_to_string(std::uint32_t addr_be)
    {
        char buf[INET_ADDRSTRLEN] = {};
        in_addr a{};
        a.s_addr = addr_be;
        ::inet_ntop(AF_INET, &a, buf, sizeof(buf));
        return buf;
    }

    std::string to_string(const CidrV4 &c)
    {
        return ipv4_to_string(c.addr_be) + "/" + std::to_string(c.prefix);
    }

    std::string to_network_cidr(const CidrV4 &c)
    {
        return to_string(to_network(c));
    }

    bool contains(const CidrV4 &net,
                  std::uint32_t addr_be)
    {
        const std::uint32_t mask = prefix_mask_be(net.prefix);
        return (net.addr_be & mask) == (addr_be & mask);
    }

    std::optional<std::string> read_sysctl(const std::string &dotted)
    {
        const std::string path = ToProcSysPath(dotted);
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
        {
            return std::nullopt;
        }

        std::string data;
        char        buf[256];
        for (;;)
        {
            const ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0)
            {
                data.append(buf, buf + n);
                continue;
            }
            if (n < 0 && errno == EINTR)
            {
                continue;
            }
            break;
        }
        ::close(fd);

        while (!data.empty() &&
               (data.back() == '\n' || data.back() == ' ' || data.back() == '\t'))
        {
            data.pop_back();
        }
        if (data.empty())
        {
            return std::nullopt;
        }
        return data;
    }

    bool write_sysctl(const std::string &dotted,
                      const std::string &val)
    {
        const std::string path = ToProcSysPath(dotted);
        int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd < 0) return false;

        const ssize_t need = static_cast<ssize_t>(val.size());
        const ssize_t n    = ::write(fd, val.c_str(), val.size());
        ::close(fd);

        return n == need;
    }

    nl_sock *nl_connect_route()
    {
        nl_sock *sk = nl_socket_alloc();
        if (!sk) return nullptr;

        if (nl_connect(sk, NETLINK_ROUTE) < 0)
        {
            nl_socket_free(sk);
            return nullptr;
        }
        return sk;
    }
} // namespace NetConfig
