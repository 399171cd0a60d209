#include "IpRange.hpp"
#include <arpa/inet.h>

namespace hearth::common
{
    std::optional<uint32_t> ParseIPv4(const std::string &text)
    {
        in_addr addr{};
        if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatIPv4(uint32_t host_order)
    {
        in_addr addr{};
        addr.s_addr = htonl(host_order);
        char buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &addr, buf, sizeof(buf));
        return buf;
    }

    std::vector<std::string> IpRange::Hosts() const
    {
        std::vector<std::string> hosts;
        if (last < first)
            return hosts;
        hosts.reserve(Size());
        for (uint64_t ip = first; ip <= last; ++ip)
            hosts.push_back(FormatIPv4(static_cast<uint32_t>(ip)));
        return hosts;
    }

    std::optional<IpRange> ParseIpRange(const std::string &text)
    {
        auto slash = text.find('/');
        if (slash != std::string::npos)
        {
            auto base = ParseIPv4(text.substr(0, slash));
            if (!base)
                return std::nullopt;

            int prefix = -1;
            try
            {
                size_t used = 0;
                prefix = std::stoi(text.substr(slash + 1), &used);
                if (used != text.size() - slash - 1)
                    return std::nullopt;
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
            if (prefix < 0 || prefix > 32)
                return std::nullopt;

            uint32_t mask = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
            uint32_t network = *base & mask;
            uint32_t broadcast = network | ~mask;

            IpRange range{network, broadcast};
            if (prefix <= 30)
            {
                range.first = network + 1;
                range.last = broadcast - 1;
            }
            return range;
        }

        auto dash = text.find('-');
        if (dash != std::string::npos)
        {
            auto first = ParseIPv4(text.substr(0, dash));
            auto last = ParseIPv4(text.substr(dash + 1));
            if (!first || !last || *last < *first)
                return std::nullopt;
            return IpRange{*first, *last};
        }

        auto single = ParseIPv4(text);
        if (!single)
            return std::nullopt;
        return IpRange{*single, *single};
    }
}
