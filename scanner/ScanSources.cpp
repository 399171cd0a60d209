#include "ScanSources.hpp"
#include "../common/IpRange.hpp"
#include <iostream>
#include <map>
#include <stdexcept>

namespace hearth::scanner
{
    ArpSweepSource::ArpSweepSource(common::PresenceConfig config, ProbeFn probe)
        : m_config(std::move(config)), m_probe(std::move(probe))
    {
    }

    void ArpSweepSource::Setup()
    {
        std::string rangeText = m_config.ip_range;
        if (rangeText.empty())
        {
            auto derived = NetworkScanner::DefaultRange(m_config.interface);
            if (!derived)
            {
                std::cerr << "[Scanner] WARNING: no sweep range available, relying on the ARP cache only\n";
                m_targets.clear();
                return;
            }
            rangeText = *derived;
        }

        auto range = common::ParseIpRange(rangeText);
        if (!range || range->Size() > common::MAX_SWEEP_HOSTS)
            throw std::runtime_error("unusable sweep range '" + rangeText + "'");

        m_targets = range->Hosts();
        std::cout << "[Scanner] Sweep range " << rangeText << " (" << m_targets.size() << " hosts)\n";
    }

    std::vector<Observation> ArpSweepSource::Scan()
    {
        if (!m_targets.empty())
        {
            if (m_probe)
            {
                NetworkScanner::PingSweep(m_targets, m_config.max_concurrent_probes, m_probe);
            }
            else if (!NetworkScanner::IsRoot())
            {
                std::cerr << "[Scanner] WARNING: not running as root, ping sweep skipped\n";
            }
            else
            {
                const auto timeout = m_config.ping_timeout;
                const auto iface = m_config.interface;
                auto alive = NetworkScanner::PingSweep(m_targets, m_config.max_concurrent_probes,
                                                       [timeout, iface](const std::string &ip)
                                                       { return NetworkScanner::Ping(ip, timeout, iface); });
                std::cout << "[Scanner] " << alive.size() << "/" << m_targets.size() << " hosts answered\n";
            }
        }

        std::vector<Observation> observations;
        for (const auto &entry : NetworkScanner::ReadArpTable(m_config.arp_table_path, m_config.interface))
        {
            Observation obs;
            obs.mac = entry.mac;
            obs.ip = entry.ip;
            obs.source = ObservationKind::Arp;
            observations.push_back(std::move(obs));
        }
        return observations;
    }

    MdnsSource::MdnsSource(common::PresenceConfig config)
        : m_config(std::move(config)), m_browser(m_config.mdns.service_types, m_config.mdns.listen)
    {
    }

    std::vector<Observation> MdnsSource::ToObservations(const std::vector<MdnsHost> &hosts,
                                                        const std::vector<ArpEntry> &arp)
    {
        std::map<std::string, std::string> macByIp;
        for (const auto &entry : arp)
            macByIp[entry.ip] = entry.mac;

        std::vector<Observation> observations;
        for (const auto &host : hosts)
        {
            auto it = macByIp.find(host.ip);
            if (it == macByIp.end())
                continue;

            Observation obs;
            obs.mac = it->second;
            obs.ip = host.ip;
            obs.hostname = host.hostname;
            obs.services = host.services;
            obs.source = ObservationKind::Mdns;
            observations.push_back(std::move(obs));
        }
        return observations;
    }

    std::vector<Observation> MdnsSource::Scan()
    {
        auto hosts = m_browser.Browse();
        if (hosts.empty())
            return {};
        return ToObservations(hosts, NetworkScanner::ReadArpTable(m_config.arp_table_path, m_config.interface));
    }

    SnmpSource::SnmpSource(common::SnmpConfig config)
        : m_config(std::move(config)), m_client(m_config.timeout, m_config.retries)
    {
    }

    std::vector<Observation> SnmpSource::Scan()
    {
        return m_client.FetchClientTable(m_config.target, m_config.community, m_config.phys_oid, m_config.hostname_oid);
    }
}
