#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "GpioDriver.hpp"
#include "HardwareStrategy.hpp"
#include "../common/Config.hpp"
#include "../common/EventBus.hpp"
#include "../service/HotSwapSet.hpp"
#include "../service/ThreadedService.hpp"
#include "../store/PresenceStore.hpp"

namespace hearth::hardware
{
    struct HardwareNotification
    {
        std::string hardware_id;
        std::string name;
        double value = 0.0;
        std::string label;
        std::string unit;
        common::TimePoint timestamp{};
    };

    struct HardwareStatus
    {
        std::string id;
        std::string name;
        std::string driver;
        HardwareReading reading;
        std::optional<common::TimePoint> last_activity;
    };

    using HardwareBus = common::EventBus<HardwareNotification>;

    class HardwareService : public service::ThreadedService
    {
    public:
        // store may be null, in which case readings are only published. A
        // non-null gpio overrides the configured backend.
        HardwareService(std::shared_ptr<store::PresenceStore> store,
                        std::shared_ptr<HardwareBus> bus,
                        const common::HardwareConfig &config,
                        std::chrono::milliseconds faultBackoff,
                        std::shared_ptr<GpioDriver> gpio = nullptr);
        ~HardwareService() override;

        service::ReloadStats ReloadConfig(const common::HardwareConfig &config);

        // Reads every active strategy once. A failing device is logged and
        // skipped; the others are still read.
        void PollOnce();

        std::vector<HardwareStatus> CurrentReadings() const;

        // Throws HardwareError for an unknown id or unsupported command.
        HardwareReading ExecuteCommand(const std::string &hardware_id, const std::string &command);

    protected:
        void OnStart() override;
        void RunCycle() override;
        void OnStop() override;

    private:
        std::shared_ptr<GpioDriver> DriverFor(const common::HardwareConfig &config);
        void HandleReading(const HardwareStrategy &strategy, const HardwareReading &reading, common::TimePoint now);

        std::shared_ptr<store::PresenceStore> m_store;
        std::shared_ptr<HardwareBus> m_bus;
        service::HotSwapSet<HardwareStrategy> m_strategies;

        std::mutex m_configMutex;
        common::HardwareConfig m_config;
        std::shared_ptr<GpioDriver> m_gpio;
        bool m_fixedGpio;
    };
}
