#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace hearth::common
{
    struct DatabaseConfig
    {
        std::string path = "hearth.db";
        int connect_attempts = 3;
        std::chrono::milliseconds retry_delay{1000};
    };

    struct SchedulerConfig
    {
        std::chrono::milliseconds fault_backoff{5000};
    };

    struct MdnsConfig
    {
        bool enabled = true;
        std::chrono::milliseconds listen{1500};
        std::vector<std::string> service_types = {
            "_device-info._tcp.local",
            "_workstation._tcp.local",
            "_airplay._tcp.local",
            "_companion-link._tcp.local",
            "_googlecast._tcp.local",
            "_http._tcp.local",
        };
    };

    struct PresenceConfig
    {
        std::chrono::seconds interval{60};
        std::string interface;
        std::string ip_range;
        std::chrono::milliseconds ping_timeout{1000};
        int max_concurrent_probes = 32;
        std::string arp_table_path = "/proc/net/arp";
        int miss_threshold = 3;
        bool track_new_devices = true;
        size_t ip_history_limit = 20;
        std::string oui_file;
        MdnsConfig mdns;
    };

    struct LinkWeights
    {
        double hostname = 0.35;
        double vendor = 0.15;
        double time_window = 0.15;
        double cooccurrence = 0.35;
        // mDNS service overlap; off unless configured.
        double services = 0.0;

        double Sum() const { return hostname + vendor + time_window + cooccurrence + services; }
    };

    struct IdentityConfig
    {
        double link_threshold = 0.75;
        double link_margin = 0.1;
        int cooccurrence_saturation = 10;
        LinkWeights weights;
    };

    struct SnmpConfig
    {
        std::string target;
        std::string community = "public";
        std::chrono::milliseconds timeout{2000};
        int retries = 1;
        std::string phys_oid = "1.3.6.1.2.1.4.22.1.2";
        std::string hostname_oid;

        bool Enabled() const { return !target.empty(); }
    };

    struct HardwareDefinition
    {
        std::string id;
        std::string name;
        std::string driver;
        int pin = -1;
        bool enabled = true;
        int debounce_ms = 300;
        std::string active_label = "Active";
        std::string inactive_label = "Inactive";
        bool active_high = true;
        bool default_on = false;

        // Changes whenever any field that affects the running strategy changes.
        std::string Fingerprint() const;
    };

    struct HardwareConfig
    {
        std::chrono::milliseconds interval{100};
        std::string gpio_backend = "sysfs";
        std::string sysfs_root = "/sys/class/gpio";
        std::vector<HardwareDefinition> devices;
    };

    struct AppConfig
    {
        DatabaseConfig database;
        SchedulerConfig scheduler;
        PresenceConfig presence;
        IdentityConfig identity;
        SnmpConfig snmp;
        HardwareConfig hardware;
    };

    // Both throw ConfigError on unreadable input, wrong types or invalid values.
    AppConfig LoadConfig(const std::string &path);
    AppConfig ParseConfig(const std::string &yaml_text);

    void ValidateConfig(const AppConfig &config);
}
