#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "IdentityResolver.hpp"
#include "PresenceTracker.hpp"
#include "../common/Config.hpp"
#include "../common/EventBus.hpp"
#include "../scanner/Observation.hpp"
#include "../service/HotSwapSet.hpp"
#include "../service/ThreadedService.hpp"
#include "../store/PresenceStore.hpp"

namespace hearth::presence
{
    struct PresenceNotification
    {
        int64_t device_id = 0;
        std::string device_name;
        store::PresenceEventType event_type = store::PresenceEventType::Arrived;
        common::TimePoint timestamp{};
        std::string ip_address;
    };

    using PresenceBus = common::EventBus<PresenceNotification>;
    using SourceSet = service::HotSwapSet<scanner::ObservationSource>;
    using SourceFactory = std::function<std::vector<SourceSet::Candidate>(const common::AppConfig &)>;

    struct CycleReport
    {
        size_t observations = 0;
        int source_failures = 0;
        int created = 0;
        int linked = 0;
        std::vector<store::PresenceEvent> events;
        common::TimePoint timestamp{};
    };

    class PresenceService : public service::ThreadedService
    {
    public:
        PresenceService(std::shared_ptr<store::PresenceStore> store,
                        std::shared_ptr<PresenceBus> bus,
                        const common::AppConfig &config,
                        SourceFactory factory = DefaultSources);
        ~PresenceService() override;

        // Rebuilds resolver/tracker settings and diffs the source set.
        // Sources whose settings did not change keep their instance.
        service::ReloadStats ReloadConfig(const common::AppConfig &config);

        // One full scan/resolve/track cycle on the calling thread. Source
        // failures are contained; store failures throw StoreError.
        CycleReport RunOnce();

        std::vector<store::Device> WhoIsHome();
        store::EventPage RecentEvents(int page, int per_page);
        std::optional<store::DeviceDetail> GetDeviceDetail(int64_t device_id);

        size_t ActiveSourceCount() const { return m_sources.Size(); }

        // ARP sweep always; mDNS when enabled; SNMP when a target is set.
        static std::vector<SourceSet::Candidate> DefaultSources(const common::AppConfig &config);

    protected:
        void OnStart() override;
        void RunCycle() override;
        void OnStop() override;

    private:
        struct Pipeline
        {
            std::shared_ptr<IdentityResolver> resolver;
            std::shared_ptr<PresenceTracker> tracker;
        };

        Pipeline BuildPipeline(const common::AppConfig &config);
        Pipeline CurrentPipeline() const;

        std::shared_ptr<store::PresenceStore> m_store;
        std::shared_ptr<PresenceBus> m_bus;
        SourceFactory m_factory;
        SourceSet m_sources;

        mutable std::mutex m_configMutex;
        common::AppConfig m_config;
        Pipeline m_pipeline;

        std::mutex m_cycleMutex;
        common::TimePoint m_lastCycle{};
    };
}
