#include "PresenceService.hpp"
#include "../common/Errors.hpp"
#include "../scanner/ScanSources.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace hearth::presence
{
    namespace
    {
        std::string ArpFingerprint(const common::PresenceConfig &p)
        {
            std::stringstream ss;
            ss << p.interface << '|' << p.ip_range << '|' << p.ping_timeout.count() << '|'
               << p.max_concurrent_probes << '|' << p.arp_table_path;
            return ss.str();
        }

        std::string MdnsFingerprint(const common::PresenceConfig &p)
        {
            std::stringstream ss;
            ss << p.interface << '|' << p.arp_table_path << '|' << p.mdns.listen.count();
            for (const auto &type : p.mdns.service_types)
                ss << '|' << type;
            return ss.str();
        }

        std::string SnmpFingerprint(const common::SnmpConfig &s)
        {
            std::stringstream ss;
            ss << s.target << '|' << s.community << '|' << s.timeout.count() << '|' << s.retries << '|'
               << s.phys_oid << '|' << s.hostname_oid;
            return ss.str();
        }
    }

    PresenceService::PresenceService(std::shared_ptr<store::PresenceStore> store,
                                     std::shared_ptr<PresenceBus> bus,
                                     const common::AppConfig &config,
                                     SourceFactory factory)
        : ThreadedService("presence",
                          std::chrono::duration_cast<std::chrono::milliseconds>(config.presence.interval),
                          config.scheduler.fault_backoff),
          m_store(std::move(store)),
          m_bus(std::move(bus)),
          m_factory(std::move(factory)),
          m_sources("Presence"),
          m_config(config)
    {
        m_pipeline = BuildPipeline(config);
    }

    PresenceService::~PresenceService()
    {
        Stop();
    }

    std::vector<SourceSet::Candidate> PresenceService::DefaultSources(const common::AppConfig &config)
    {
        std::vector<SourceSet::Candidate> candidates;

        const auto presence = config.presence;
        candidates.push_back({"arp", ArpFingerprint(presence), [presence]()
                              { return std::make_shared<scanner::ArpSweepSource>(presence); }});

        if (presence.mdns.enabled)
        {
            candidates.push_back({"mdns", MdnsFingerprint(presence), [presence]()
                                  { return std::make_shared<scanner::MdnsSource>(presence); }});
        }

        if (config.snmp.Enabled())
        {
            const auto snmp = config.snmp;
            candidates.push_back({"snmp", SnmpFingerprint(snmp), [snmp]()
                                  { return std::make_shared<scanner::SnmpSource>(snmp); }});
        }
        return candidates;
    }

    PresenceService::Pipeline PresenceService::BuildPipeline(const common::AppConfig &config)
    {
        auto oui = std::make_shared<OuiRegistry>();
        if (!config.presence.oui_file.empty())
            oui->LoadFile(config.presence.oui_file);

        Pipeline pipeline;
        pipeline.resolver = std::make_shared<IdentityResolver>(config.identity, config.presence, oui);
        pipeline.tracker = std::make_shared<PresenceTracker>(config.presence.miss_threshold);
        return pipeline;
    }

    PresenceService::Pipeline PresenceService::CurrentPipeline() const
    {
        std::lock_guard<std::mutex> lock(m_configMutex);
        return m_pipeline;
    }

    service::ReloadStats PresenceService::ReloadConfig(const common::AppConfig &config)
    {
        Pipeline pipeline = BuildPipeline(config);
        auto stats = m_sources.Reload(m_factory(config));

        {
            std::lock_guard<std::mutex> lock(m_configMutex);
            m_config = config;
            m_pipeline = pipeline;
        }
        SetInterval(std::chrono::duration_cast<std::chrono::milliseconds>(config.presence.interval));
        return stats;
    }

    void PresenceService::OnStart()
    {
        if (!m_store->Ping())
            throw common::StoreError("store at " + m_store->Path() + " is not reachable");

        common::AppConfig config;
        {
            std::lock_guard<std::mutex> lock(m_configMutex);
            config = m_config;
        }
        ReloadConfig(config);
    }

    void PresenceService::OnStop()
    {
        m_sources.Clear();
    }

    void PresenceService::RunCycle()
    {
        RunOnce();
    }

    CycleReport PresenceService::RunOnce()
    {
        std::lock_guard<std::mutex> cycle(m_cycleMutex);
        CycleReport report;

        auto sources = m_sources.Snapshot();
        Pipeline pipeline = CurrentPipeline();

        std::vector<scanner::Observation> observations;
        for (const auto &pair : *sources)
        {
            try
            {
                auto found = pair.second.instance->Scan();
                observations.insert(observations.end(), found.begin(), found.end());
            }
            catch (const std::exception &e)
            {
                ++report.source_failures;
                std::cerr << "[Presence] WARNING: source '" << pair.first << "' failed: " << e.what() << "\n";
            }
        }
        report.observations = observations.size();

        // Event timestamps must never go backwards, even if the wall clock does.
        const auto now = std::max(common::Clock::now(), m_lastCycle);
        m_lastCycle = now;
        report.timestamp = now;

        auto session = m_store->OpenSession();
        ResolveResult resolved = pipeline.resolver->Resolve(*session, observations, now);
        TrackResult tracked = pipeline.tracker->Update(*session, resolved.observed_ids, now);
        session->Commit();

        report.created = resolved.created;
        report.linked = resolved.linked;
        report.events = tracked.events;

        for (const auto &event : tracked.events)
        {
            PresenceNotification note;
            note.device_id = event.device_id;
            note.device_name = event.device_name;
            note.event_type = event.event_type;
            note.timestamp = event.timestamp;
            note.ip_address = event.ip_address;
            if (m_bus)
                m_bus->Publish(note);
        }

        std::cout << "[Presence] Cycle: " << report.observations << " observations, " << resolved.observed_ids.size()
                  << " devices, " << tracked.snapshot.devices.size() << " home, " << report.events.size() << " events\n";
        return report;
    }

    std::vector<store::Device> PresenceService::WhoIsHome()
    {
        return m_store->WhoIsHome();
    }

    store::EventPage PresenceService::RecentEvents(int page, int per_page)
    {
        return m_store->RecentEvents(page, per_page);
    }

    std::optional<store::DeviceDetail> PresenceService::GetDeviceDetail(int64_t device_id)
    {
        return m_store->GetDeviceDetail(device_id);
    }
}
