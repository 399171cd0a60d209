#include "Config.hpp"
#include "Errors.hpp"
#include "IpRange.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <sstream>

namespace hearth::common
{
    namespace
    {
        template <typename T>
        void ReadScalar(const YAML::Node &section, const std::string &path, const char *key, T &out)
        {
            const YAML::Node node = section[key];
            if (!node || node.IsNull())
                return;
            try
            {
                out = node.as<T>();
            }
            catch (const YAML::Exception &e)
            {
                throw ConfigError("Invalid value for " + path + "." + key + ": " + e.what());
            }
        }

        template <typename Duration>
        void ReadDuration(const YAML::Node &section, const std::string &path, const char *key, Duration &out)
        {
            long long count = out.count();
            ReadScalar(section, path, key, count);
            out = Duration(count);
        }

        YAML::Node Section(const YAML::Node &root, const char *key)
        {
            const YAML::Node node = root[key];
            if (node && !node.IsNull() && !node.IsMap())
                throw ConfigError(std::string("Section '") + key + "' must be a mapping");
            return node;
        }

        void ParseDatabase(const YAML::Node &node, DatabaseConfig &cfg)
        {
            if (!node)
                return;
            ReadScalar(node, "database", "path", cfg.path);
            ReadScalar(node, "database", "connect_attempts", cfg.connect_attempts);
            ReadDuration(node, "database", "retry_delay_ms", cfg.retry_delay);
        }

        void ParsePresence(const YAML::Node &node, PresenceConfig &cfg)
        {
            if (!node)
                return;
            ReadDuration(node, "presence", "interval_seconds", cfg.interval);
            ReadScalar(node, "presence", "interface", cfg.interface);
            ReadScalar(node, "presence", "ip_range", cfg.ip_range);
            ReadDuration(node, "presence", "ping_timeout_ms", cfg.ping_timeout);
            ReadScalar(node, "presence", "max_concurrent_probes", cfg.max_concurrent_probes);
            ReadScalar(node, "presence", "arp_table_path", cfg.arp_table_path);
            ReadScalar(node, "presence", "miss_threshold", cfg.miss_threshold);
            ReadScalar(node, "presence", "track_new_devices", cfg.track_new_devices);
            ReadScalar(node, "presence", "ip_history_limit", cfg.ip_history_limit);
            ReadScalar(node, "presence", "oui_file", cfg.oui_file);

            const YAML::Node mdns = Section(node, "mdns");
            if (mdns)
            {
                ReadScalar(mdns, "presence.mdns", "enabled", cfg.mdns.enabled);
                ReadDuration(mdns, "presence.mdns", "listen_ms", cfg.mdns.listen);
                ReadScalar(mdns, "presence.mdns", "service_types", cfg.mdns.service_types);
            }
        }

        void ParseIdentity(const YAML::Node &node, IdentityConfig &cfg)
        {
            if (!node)
                return;
            ReadScalar(node, "identity", "link_threshold", cfg.link_threshold);
            ReadScalar(node, "identity", "link_margin", cfg.link_margin);
            ReadScalar(node, "identity", "cooccurrence_saturation", cfg.cooccurrence_saturation);

            const YAML::Node weights = Section(node, "weights");
            if (weights)
            {
                ReadScalar(weights, "identity.weights", "hostname", cfg.weights.hostname);
                ReadScalar(weights, "identity.weights", "vendor", cfg.weights.vendor);
                ReadScalar(weights, "identity.weights", "time_window", cfg.weights.time_window);
                ReadScalar(weights, "identity.weights", "cooccurrence", cfg.weights.cooccurrence);
                ReadScalar(weights, "identity.weights", "services", cfg.weights.services);
            }
        }

        void ParseSnmp(const YAML::Node &node, SnmpConfig &cfg)
        {
            if (!node)
                return;
            ReadScalar(node, "snmp", "target", cfg.target);
            ReadScalar(node, "snmp", "community", cfg.community);
            ReadDuration(node, "snmp", "timeout_ms", cfg.timeout);
            ReadScalar(node, "snmp", "retries", cfg.retries);
            ReadScalar(node, "snmp", "phys_oid", cfg.phys_oid);
            ReadScalar(node, "snmp", "hostname_oid", cfg.hostname_oid);
        }

        void ParseHardware(const YAML::Node &node, HardwareConfig &cfg)
        {
            if (!node)
                return;
            ReadDuration(node, "hardware", "interval_ms", cfg.interval);
            ReadScalar(node, "hardware", "gpio_backend", cfg.gpio_backend);
            ReadScalar(node, "hardware", "sysfs_root", cfg.sysfs_root);

            const YAML::Node devices = node["devices"];
            if (!devices || devices.IsNull())
                return;
            if (!devices.IsSequence())
                throw ConfigError("hardware.devices must be a list");

            for (size_t i = 0; i < devices.size(); ++i)
            {
                const YAML::Node dev = devices[i];
                if (!dev.IsMap())
                    throw ConfigError("hardware.devices[" + std::to_string(i) + "] must be a mapping");

                std::string path = "hardware.devices[" + std::to_string(i) + "]";
                HardwareDefinition def;
                ReadScalar(dev, path, "id", def.id);
                ReadScalar(dev, path, "name", def.name);
                ReadScalar(dev, path, "driver", def.driver);
                ReadScalar(dev, path, "pin", def.pin);
                ReadScalar(dev, path, "enabled", def.enabled);
                ReadScalar(dev, path, "debounce_ms", def.debounce_ms);
                ReadScalar(dev, path, "active_label", def.active_label);
                ReadScalar(dev, path, "inactive_label", def.inactive_label);
                ReadScalar(dev, path, "active_high", def.active_high);
                ReadScalar(dev, path, "default_on", def.default_on);
                if (def.name.empty())
                    def.name = def.id;
                cfg.devices.push_back(def);
            }
        }

        AppConfig FromYaml(const YAML::Node &root)
        {
            AppConfig config;
            if (!root || root.IsNull())
            {
                ValidateConfig(config);
                return config;
            }
            if (!root.IsMap())
                throw ConfigError("Top level of the config must be a mapping");

            ParseDatabase(Section(root, "database"), config.database);

            const YAML::Node scheduler = Section(root, "scheduler");
            if (scheduler)
                ReadDuration(scheduler, "scheduler", "fault_backoff_ms", config.scheduler.fault_backoff);

            ParsePresence(Section(root, "presence"), config.presence);
            ParseIdentity(Section(root, "identity"), config.identity);
            ParseSnmp(Section(root, "snmp"), config.snmp);
            ParseHardware(Section(root, "hardware"), config.hardware);

            ValidateConfig(config);
            return config;
        }
    }

    std::string HardwareDefinition::Fingerprint() const
    {
        std::stringstream ss;
        ss << driver << '|' << pin << '|' << name << '|' << enabled << '|' << debounce_ms << '|'
           << active_label << '|' << inactive_label << '|' << active_high << '|' << default_on;
        return ss.str();
    }

    AppConfig LoadConfig(const std::string &path)
    {
        YAML::Node root;
        try
        {
            root = YAML::LoadFile(path);
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError("Failed to load YAML config " + path + ": " + e.what());
        }
        return FromYaml(root);
    }

    AppConfig ParseConfig(const std::string &yaml_text)
    {
        YAML::Node root;
        try
        {
            root = YAML::Load(yaml_text);
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError(std::string("Failed to parse YAML config: ") + e.what());
        }
        return FromYaml(root);
    }

    void ValidateConfig(const AppConfig &config)
    {
        if (config.database.path.empty())
            throw ConfigError("database.path must not be empty");
        if (config.database.connect_attempts < 1)
            throw ConfigError("database.connect_attempts must be at least 1");
        if (config.database.retry_delay.count() < 0)
            throw ConfigError("database.retry_delay_ms must not be negative");
        if (config.scheduler.fault_backoff.count() <= 0)
            throw ConfigError("scheduler.fault_backoff_ms must be positive");

        const auto &p = config.presence;
        if (p.interval.count() <= 0)
            throw ConfigError("presence.interval_seconds must be positive");
        if (p.ping_timeout.count() <= 0)
            throw ConfigError("presence.ping_timeout_ms must be positive");
        if (p.mdns.listen.count() <= 0)
            throw ConfigError("presence.mdns.listen_ms must be positive");
        if (p.max_concurrent_probes < 1)
            throw ConfigError("presence.max_concurrent_probes must be at least 1");
        if (p.miss_threshold < 1)
            throw ConfigError("presence.miss_threshold must be at least 1");
        if (p.ip_history_limit == 0)
            throw ConfigError("presence.ip_history_limit must be at least 1");
        if (!p.ip_range.empty())
        {
            auto range = ParseIpRange(p.ip_range);
            if (!range)
                throw ConfigError("presence.ip_range is not a valid range: " + p.ip_range);
            if (range->Size() > MAX_SWEEP_HOSTS)
                throw ConfigError("presence.ip_range covers more than " + std::to_string(MAX_SWEEP_HOSTS) + " hosts");
        }

        const auto &id = config.identity;
        if (id.link_threshold < 0.0 || id.link_threshold > 1.0)
            throw ConfigError("identity.link_threshold must be within [0, 1]");
        if (id.link_margin < 0.0 || id.link_margin > 1.0)
            throw ConfigError("identity.link_margin must be within [0, 1]");
        if (id.cooccurrence_saturation < 1)
            throw ConfigError("identity.cooccurrence_saturation must be at least 1");
        const auto &w = id.weights;
        if (w.hostname < 0.0 || w.vendor < 0.0 || w.time_window < 0.0 || w.cooccurrence < 0.0 || w.services < 0.0)
            throw ConfigError("identity.weights must not be negative");
        if (std::fabs(w.Sum() - 1.0) > 1e-6)
            throw ConfigError("identity.weights must sum to 1.0");

        if (config.snmp.timeout.count() <= 0)
            throw ConfigError("snmp.timeout_ms must be positive");
        if (config.snmp.retries < 0)
            throw ConfigError("snmp.retries must not be negative");

        const auto &hw = config.hardware;
        if (hw.interval.count() <= 0)
            throw ConfigError("hardware.interval_ms must be positive");
        if (hw.gpio_backend != "sysfs" && hw.gpio_backend != "simulated")
            throw ConfigError("hardware.gpio_backend must be 'sysfs' or 'simulated'");
        for (size_t i = 0; i < hw.devices.size(); ++i)
        {
            const auto &def = hw.devices[i];
            if (def.id.empty())
                throw ConfigError("hardware.devices[" + std::to_string(i) + "].id is required");
            for (size_t j = 0; j < i; ++j)
            {
                if (hw.devices[j].id == def.id)
                    throw ConfigError("hardware device id '" + def.id + "' is used twice");
            }
            if (def.debounce_ms < 0)
                throw ConfigError("hardware.devices[" + std::to_string(i) + "].debounce_ms must not be negative");
        }
    }
}
