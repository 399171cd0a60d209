#include "PresenceTracker.hpp"
#include <algorithm>
#include <iostream>
#include <map>

namespace hearth::presence
{
    using store::Device;
    using store::PresenceEvent;
    using store::PresenceEventType;

    PresenceTracker::PresenceTracker(int missThreshold) : m_missThreshold(std::max(missThreshold, 1)) {}

    TrackResult PresenceTracker::Update(store::StoreSession &session, const std::set<int64_t> &observedIds, common::TimePoint now)
    {
        TrackResult result;
        std::vector<Device> devices = session.LoadDevices();

        std::map<int64_t, std::vector<Device *>> children;
        for (auto &d : devices)
        {
            if (d.linked_to_device_id)
                children[*d.linked_to_device_id].push_back(&d);
        }

        std::map<int64_t, bool> rootHome;

        for (auto &identity : devices)
        {
            if (identity.linked_to_device_id || !identity.track_presence)
                continue;

            // Most recently seen member supplies the IP/hostname snapshot.
            const Device *seenBy = nullptr;
            if (observedIds.count(identity.id))
                seenBy = &identity;
            for (const Device *child : children[identity.id])
            {
                if (observedIds.count(child->id) && (!seenBy || child->last_seen > seenBy->last_seen))
                    seenBy = child;
            }

            const bool wasHome = identity.is_home;
            const int oldMisses = identity.missed_cycles;

            if (seenBy)
            {
                identity.missed_cycles = 0;
                if (!identity.is_home)
                {
                    identity.is_home = true;
                    identity.last_seen = std::max(identity.last_seen, now);

                    PresenceEvent event;
                    event.device_id = identity.id;
                    event.device_name = identity.name;
                    event.event_type = PresenceEventType::Arrived;
                    event.timestamp = now;
                    event.ip_address = seenBy->last_ip;
                    event.hostname = seenBy->hostname.empty() ? identity.hostname : seenBy->hostname;
                    result.events.push_back(event);
                }
            }
            else
            {
                identity.missed_cycles = std::min(identity.missed_cycles + 1, m_missThreshold);
                if (identity.is_home && identity.missed_cycles >= m_missThreshold)
                {
                    identity.is_home = false;

                    PresenceEvent event;
                    event.device_id = identity.id;
                    event.device_name = identity.name;
                    event.event_type = PresenceEventType::Left;
                    event.timestamp = now;
                    event.ip_address = identity.last_ip;
                    event.hostname = identity.hostname;
                    result.events.push_back(event);
                }
            }

            const bool changed = wasHome != identity.is_home || oldMisses != identity.missed_cycles;
            if (changed)
                session.UpdateDevice(identity);

            rootHome[identity.id] = identity.is_home;
            if (identity.is_home)
                result.snapshot.devices.push_back({identity.id, identity.mac_address, identity.last_ip});
        }

        for (auto &d : devices)
        {
            if (!d.linked_to_device_id)
                continue;
            auto it = rootHome.find(*d.linked_to_device_id);
            if (it != rootHome.end() && d.is_home != it->second)
            {
                d.is_home = it->second;
                session.UpdateDevice(d);
            }
        }

        for (auto &event : result.events)
        {
            session.InsertPresenceEvent(event);
            std::cout << "[Tracker] " << event.device_name << " " << store::ToString(event.event_type)
                      << " (" << event.ip_address << ")\n";
        }

        result.snapshot.timestamp = now;
        session.InsertSnapshot(result.snapshot);
        return result;
    }
}
