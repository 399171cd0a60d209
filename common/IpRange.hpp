#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hearth::common
{
    inline constexpr uint32_t MAX_SWEEP_HOSTS = 1024;

    struct IpRange
    {
        uint32_t first = 0;
        uint32_t last = 0;

        uint64_t Size() const { return last >= first ? static_cast<uint64_t>(last) - first + 1 : 0; }
        std::vector<std::string> Hosts() const;
    };

    // "192.168.1.0/24" (network and broadcast excluded for /30 and wider)
    // or "192.168.1.10-192.168.1.50".
    std::optional<IpRange> ParseIpRange(const std::string &text);

    std::optional<uint32_t> ParseIPv4(const std::string &text);
    std::string FormatIPv4(uint32_t host_order);
}
