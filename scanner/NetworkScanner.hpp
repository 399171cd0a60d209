#pragma once

#include <chrono>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace hearth::scanner
{
    struct ArpEntry
    {
        std::string ip;
        std::string mac;
        std::string device;
    };

    using ProbeFn = std::function<bool(const std::string &ip)>;

    class NetworkScanner
    {
    public:
        // /proc/net/arp layout. Incomplete entries (flags 0x0 or an all-zero
        // MAC) are skipped; MACs come back normalized. An empty iface keeps
        // every device.
        static std::vector<ArpEntry> ParseArpTable(std::istream &in, const std::string &iface = "");
        static std::vector<ArpEntry> ReadArpTable(const std::string &path, const std::string &iface = "");

        static bool IsRoot();

        // ICMP echo via libtins. False on timeout or any capture/send error.
        static bool Ping(const std::string &ip, std::chrono::milliseconds timeout, const std::string &iface = "");

        // Runs probe over every host on at most maxConcurrent threads and
        // waits for all of them. Returns the hosts that answered, in input order.
        static std::vector<std::string> PingSweep(const std::vector<std::string> &hosts,
                                                  int maxConcurrent,
                                                  const ProbeFn &probe);

        // "first-last" range of the interface's subnet, clamped to the /24
        // around the local address when the subnet is too large to sweep.
        static std::optional<std::string> DefaultRange(const std::string &iface = "");
    };
}
