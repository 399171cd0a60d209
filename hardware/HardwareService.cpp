#include "HardwareService.hpp"
#include "../common/Errors.hpp"
#include <iostream>

namespace hearth::hardware
{
    HardwareService::HardwareService(std::shared_ptr<store::PresenceStore> store,
                                     std::shared_ptr<HardwareBus> bus,
                                     const common::HardwareConfig &config,
                                     std::chrono::milliseconds faultBackoff,
                                     std::shared_ptr<GpioDriver> gpio)
        : ThreadedService("hardware", config.interval, faultBackoff),
          m_store(std::move(store)),
          m_bus(std::move(bus)),
          m_strategies("Hardware"),
          m_config(config),
          m_gpio(std::move(gpio)),
          m_fixedGpio(m_gpio != nullptr)
    {
    }

    HardwareService::~HardwareService()
    {
        Stop();
    }

    std::shared_ptr<GpioDriver> HardwareService::DriverFor(const common::HardwareConfig &config)
    {
        std::lock_guard<std::mutex> lock(m_configMutex);
        if (m_fixedGpio)
            return m_gpio;

        if (!m_gpio || config.gpio_backend != m_config.gpio_backend || config.sysfs_root != m_config.sysfs_root)
            m_gpio = MakeGpioDriver(config);
        return m_gpio;
    }

    service::ReloadStats HardwareService::ReloadConfig(const common::HardwareConfig &config)
    {
        auto gpio = DriverFor(config);

        std::vector<service::HotSwapSet<HardwareStrategy>::Candidate> candidates;
        for (const auto &def : config.devices)
        {
            if (!def.enabled)
                continue;
            std::string fingerprint = config.gpio_backend + "|" + config.sysfs_root + "|" + def.Fingerprint();
            candidates.push_back({def.id, fingerprint, [def, gpio]()
                                  { return CreateStrategy(def, gpio); }});
        }

        auto stats = m_strategies.Reload(candidates);
        {
            std::lock_guard<std::mutex> lock(m_configMutex);
            m_config = config;
        }
        SetInterval(config.interval);
        return stats;
    }

    void HardwareService::OnStart()
    {
        common::HardwareConfig config;
        {
            std::lock_guard<std::mutex> lock(m_configMutex);
            config = m_config;
        }
        ReloadConfig(config);
    }

    // Drops every strategy so pins are released; the next Start() rebuilds
    // them from the current config.
    void HardwareService::OnStop()
    {
        m_strategies.Clear();
    }

    void HardwareService::RunCycle()
    {
        PollOnce();
    }

    void HardwareService::PollOnce()
    {
        auto active = m_strategies.Snapshot();
        const auto now = common::Clock::now();

        for (const auto &pair : *active)
        {
            const auto &strategy = pair.second.instance;
            try
            {
                auto reading = strategy->Read(now);
                if (reading)
                    HandleReading(*strategy, *reading, now);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Hardware] ERROR: reading " << pair.first << " failed: " << e.what() << "\n";
            }
        }
    }

    void HardwareService::HandleReading(const HardwareStrategy &strategy, const HardwareReading &reading, common::TimePoint now)
    {
        const auto &def = strategy.Definition();

        HardwareNotification note;
        note.hardware_id = def.id;
        note.name = def.name;
        note.value = reading.value;
        note.label = reading.label;
        note.unit = reading.unit;
        note.timestamp = now;
        if (m_bus)
            m_bus->Publish(note);

        std::cout << "[Hardware] " << def.name << ": " << reading.label << "\n";

        if (!m_store)
            return;

        try
        {
            store::HardwareEventRecord record;
            record.hardware_id = def.id;
            record.value = reading.value;
            record.formatted_value = reading.label;
            record.unit = reading.unit;
            record.timestamp = now;

            auto session = m_store->OpenSession();
            session->InsertHardwareEvent(record);
            session->Commit();
        }
        catch (const common::StoreError &e)
        {
            std::cerr << "[Hardware] ERROR: could not persist event for " << def.id << ": " << e.what() << "\n";
        }
    }

    std::vector<HardwareStatus> HardwareService::CurrentReadings() const
    {
        std::vector<HardwareStatus> out;
        auto active = m_strategies.Snapshot();
        for (const auto &pair : *active)
        {
            const auto &strategy = pair.second.instance;
            HardwareStatus status;
            status.id = pair.first;
            status.name = strategy->Definition().name;
            status.driver = strategy->Definition().driver;
            status.reading = strategy->Current();
            status.last_activity = strategy->LastActivity();
            out.push_back(status);
        }
        return out;
    }

    HardwareReading HardwareService::ExecuteCommand(const std::string &hardware_id, const std::string &command)
    {
        auto strategy = m_strategies.Find(hardware_id);
        if (!strategy)
            throw common::HardwareError("unknown hardware '" + hardware_id + "'");

        HardwareReading reading = strategy->Execute(command);
        HandleReading(*strategy, reading, common::Clock::now());
        return reading;
    }
}
