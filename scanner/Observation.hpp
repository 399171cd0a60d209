#pragma once

#include <set>
#include <string>
#include <vector>

namespace hearth::scanner
{
    enum class ObservationKind
    {
        Arp,
        Mdns,
        Snmp
    };

    inline const char *ToString(ObservationKind kind)
    {
        switch (kind)
        {
        case ObservationKind::Arp:
            return "arp";
        case ObservationKind::Mdns:
            return "mdns";
        case ObservationKind::Snmp:
            return "snmp";
        }
        return "unknown";
    }

    struct Observation
    {
        std::string mac;
        std::string ip;
        // Empty when the source had no name for the host.
        std::string hostname;
        ObservationKind source = ObservationKind::Arp;
        std::set<std::string> services;
    };

    /*
      A discovery primitive polled once per presence cycle. Scan() should
      swallow its own I/O failures and return what it has; anything that
      still escapes is caught at the presence cycle's per-source boundary.
    */
    class ObservationSource
    {
    public:
        virtual ~ObservationSource() = default;

        virtual std::string Name() const = 0;

        // One-time acquisition when the source enters the active set. May throw.
        virtual void Setup() {}

        virtual std::vector<Observation> Scan() = 0;
    };
}
