#pragma once

#include <memory>
#include <string>
#include <vector>
#include "MdnsBrowser.hpp"
#include "NetworkScanner.hpp"
#include "Observation.hpp"
#include "SnmpClient.hpp"
#include "../common/Config.hpp"

namespace hearth::scanner
{
    // Ping sweep of the configured range followed by an ARP table read.
    class ArpSweepSource : public ObservationSource
    {
    public:
        // A null probe means ICMP through NetworkScanner::Ping, which needs root.
        explicit ArpSweepSource(common::PresenceConfig config, ProbeFn probe = nullptr);

        std::string Name() const override { return "arp"; }
        void Setup() override;
        std::vector<Observation> Scan() override;

        const std::vector<std::string> &Targets() const { return m_targets; }

    private:
        common::PresenceConfig m_config;
        ProbeFn m_probe;
        std::vector<std::string> m_targets;
    };

    class MdnsSource : public ObservationSource
    {
    public:
        explicit MdnsSource(common::PresenceConfig config);

        std::string Name() const override { return "mdns"; }
        std::vector<Observation> Scan() override;

        // Resolves each host's MAC through the ARP table; hosts without an
        // entry are dropped.
        static std::vector<Observation> ToObservations(const std::vector<MdnsHost> &hosts,
                                                       const std::vector<ArpEntry> &arp);

    private:
        common::PresenceConfig m_config;
        MdnsBrowser m_browser;
    };

    class SnmpSource : public ObservationSource
    {
    public:
        explicit SnmpSource(common::SnmpConfig config);

        std::string Name() const override { return "snmp"; }
        std::vector<Observation> Scan() override;

    private:
        common::SnmpConfig m_config;
        SnmpClient m_client;
    };
}
