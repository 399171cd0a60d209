#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../common/TimeUtil.hpp"

namespace hearth::store
{
    using common::TimePoint;

    struct IpHistoryEntry
    {
        std::string ip;
        TimePoint seen_at;
    };

    struct Device
    {
        int64_t id = 0;
        std::string mac_address;
        std::string name;
        std::string owner;
        std::string last_ip;
        std::string hostname;
        std::string vendor;
        bool is_home = false;
        bool is_randomized_mac = false;
        bool track_presence = true;
        TimePoint first_seen{};
        TimePoint last_seen{};
        std::optional<int64_t> linked_to_device_id;
        double link_confidence = 0.0;

        // Owned by the presence tracker.
        int missed_cycles = 0;

        // Bit n set when the device has been seen during local hour n.
        uint32_t connection_hours = 0;

        std::vector<IpHistoryEntry> ip_history;
        std::set<std::string> mdns_services;
    };

    enum class PresenceEventType
    {
        Arrived,
        Left
    };

    const char *ToString(PresenceEventType type);
    std::optional<PresenceEventType> ParseEventType(const std::string &text);

    struct PresenceEvent
    {
        int64_t id = 0;
        int64_t device_id = 0;
        std::string device_name;
        PresenceEventType event_type = PresenceEventType::Arrived;
        TimePoint timestamp{};
        std::string ip_address;
        std::string hostname;
    };

    struct DeviceAssociation
    {
        int64_t id = 0;
        int64_t device1_id = 0;
        int64_t device2_id = 0;
        std::string association_type = "co_occurrence";
        double confidence = 0.0;
        int co_occurrence_count = 0;
        TimePoint last_seen_together{};
    };

    struct SnapshotEntry
    {
        int64_t device_id = 0;
        std::string mac_address;
        std::string ip_address;
    };

    struct NetworkSnapshot
    {
        int64_t id = 0;
        TimePoint timestamp{};
        std::vector<SnapshotEntry> devices;
        int device_count = 0;
    };

    struct HardwareEventRecord
    {
        int64_t id = 0;
        std::string hardware_id;
        double value = 0.0;
        std::string formatted_value;
        std::string unit;
        TimePoint timestamp{};
    };

    struct DeviceDetail
    {
        Device device;
        std::optional<Device> primary;
        std::vector<Device> linked_devices;
        std::vector<DeviceAssociation> associations;
    };

    struct EventPage
    {
        std::vector<PresenceEvent> events;
        int page = 1;
        int per_page = 50;
        int64_t total = 0;
    };
}
