#include "NetworkScanner.hpp"
#include "../common/IpRange.hpp"
#include "../common/MacAddress.hpp"
#include <tins/tins.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <poll.h>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace hearth::scanner
{
    namespace
    {
        std::atomic<uint16_t> g_icmpSequence{1};

        Tins::NetworkInterface ResolveInterface(const std::string &iface)
        {
            if (iface.empty())
                return Tins::NetworkInterface::default_interface();
            return Tins::NetworkInterface(iface);
        }
    }

    bool NetworkScanner::IsRoot()
    {
        return geteuid() == 0;
    }

    std::vector<ArpEntry> NetworkScanner::ParseArpTable(std::istream &in, const std::string &iface)
    {
        std::vector<ArpEntry> results;

        std::string line;
        std::getline(in, line); // header
        while (std::getline(in, line))
        {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            if (!(ss >> ip >> hw_type >> flags >> mac >> mask >> dev))
                continue;

            if (!iface.empty() && dev != iface)
                continue;
            if (flags == "0x0")
                continue;

            auto normalized = common::NormalizeMac(mac);
            if (!normalized || common::IsUnsetMac(*normalized))
                continue;

            results.push_back({ip, *normalized, dev});
        }
        return results;
    }

    std::vector<ArpEntry> NetworkScanner::ReadArpTable(const std::string &path, const std::string &iface)
    {
        std::ifstream arpFile(path);
        if (!arpFile.is_open())
        {
            std::cerr << "[Scanner] WARNING: cannot read ARP table at " << path << "\n";
            return {};
        }
        return ParseArpTable(arpFile, iface);
    }

    bool NetworkScanner::Ping(const std::string &target_ip, std::chrono::milliseconds timeout, const std::string &iface)
    {
        try
        {
            Tins::NetworkInterface netIface = ResolveInterface(iface);

            Tins::SnifferConfiguration config;
            config.set_promisc_mode(false);
            config.set_immediate_mode(true);
            config.set_filter("icmp[icmptype] == icmp-echoreply and src host " + target_ip);

            Tins::Sniffer sniffer(netIface.name(), config);

            const uint16_t sequence = g_icmpSequence++;
            Tins::IP ip = Tins::IP(target_ip) / Tins::ICMP();
            Tins::ICMP &icmp = ip.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(0x4854);
            icmp.sequence(sequence);

            Tins::PacketSender sender;
            sender.send(ip);

            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (true)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                    return false;

                pollfd pfd{sniffer.get_fd(), POLLIN, 0};
                int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
                if (ready <= 0)
                    return false;

                Tins::Packet packet = sniffer.next_packet();
                if (!packet)
                    continue;

                const Tins::ICMP *reply = packet.pdu()->find_pdu<Tins::ICMP>();
                if (reply && reply->type() == Tins::ICMP::ECHO_REPLY && reply->sequence() == sequence)
                    return true;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scanner] WARNING: ping " << target_ip << " failed: " << e.what() << "\n";
            return false;
        }
    }

    std::vector<std::string> NetworkScanner::PingSweep(const std::vector<std::string> &hosts,
                                                       int maxConcurrent,
                                                       const ProbeFn &probe)
    {
        if (hosts.empty())
            return {};

        std::vector<char> alive(hosts.size(), 0);
        std::atomic<size_t> next{0};

        auto worker = [&]()
        {
            while (true)
            {
                size_t idx = next++;
                if (idx >= hosts.size())
                    return;
                alive[idx] = probe(hosts[idx]) ? 1 : 0;
            }
        };

        const size_t workers = std::min(hosts.size(), static_cast<size_t>(std::max(maxConcurrent, 1)));
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t i = 0; i < workers; ++i)
            threads.emplace_back(worker);
        for (auto &t : threads)
            t.join();

        std::vector<std::string> result;
        for (size_t i = 0; i < hosts.size(); ++i)
        {
            if (alive[i])
                result.push_back(hosts[i]);
        }
        return result;
    }

    std::optional<std::string> NetworkScanner::DefaultRange(const std::string &iface)
    {
        try
        {
            Tins::NetworkInterface netIface = ResolveInterface(iface);
            Tins::NetworkInterface::Info info = netIface.info();

            uint32_t ip_val = common::ParseIPv4(info.ip_addr.to_string()).value_or(0);
            uint32_t mask_val = common::ParseIPv4(info.netmask.to_string()).value_or(0);
            if (ip_val == 0)
                return std::nullopt;

            uint32_t network_val = ip_val & mask_val;
            uint32_t broadcast_val = network_val | (~mask_val);

            if (static_cast<uint64_t>(broadcast_val) - network_val + 1 > common::MAX_SWEEP_HOSTS)
            {
                std::cerr << "[Scanner] WARNING: subnet of " << netIface.name()
                          << " is too large to sweep, using the local /24\n";
                network_val = ip_val & 0xFFFFFF00u;
                broadcast_val = network_val | 0xFFu;
            }

            if (broadcast_val - network_val < 2)
                return common::FormatIPv4(network_val) + "-" + common::FormatIPv4(broadcast_val);
            return common::FormatIPv4(network_val + 1) + "-" + common::FormatIPv4(broadcast_val - 1);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scanner] WARNING: cannot inspect interface '" << iface << "': " << e.what() << "\n";
            return std::nullopt;
        }
    }
}
