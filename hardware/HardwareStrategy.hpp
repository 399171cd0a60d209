#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "GpioDriver.hpp"
#include "../common/Config.hpp"
#include "../common/TimeUtil.hpp"

namespace hearth::hardware
{
    struct HardwareReading
    {
        double value = 0.0;
        std::string label;
        std::string unit;
    };

    /*
      One configured device. Setup() claims the pins and may throw
      HardwareError; the destructor is the teardown and must not touch
      pins, because a replacement for the same pin may already be live.
    */
    class HardwareStrategy
    {
    public:
        HardwareStrategy(common::HardwareDefinition definition, std::shared_ptr<GpioDriver> gpio);
        virtual ~HardwareStrategy();

        HardwareStrategy(const HardwareStrategy &) = delete;
        HardwareStrategy &operator=(const HardwareStrategy &) = delete;

        virtual void Setup() = 0;

        // A reading only when the reported state changed.
        virtual std::optional<HardwareReading> Read(common::TimePoint now) = 0;

        // Throws HardwareError for commands the device does not support.
        virtual HardwareReading Execute(const std::string &command);

        const common::HardwareDefinition &Definition() const { return m_definition; }
        HardwareReading Current() const;
        std::optional<common::TimePoint> LastActivity() const;

    protected:
        void SetCurrent(const HardwareReading &reading, common::TimePoint when);
        std::string LabelFor(bool active) const;

        common::HardwareDefinition m_definition;
        std::shared_ptr<GpioDriver> m_gpio;

    private:
        mutable std::mutex m_stateMutex;
        HardwareReading m_current;
        std::optional<common::TimePoint> m_lastActivity;
    };

    // Input: motion, door, button, reed switch.
    class GpioBinaryStrategy : public HardwareStrategy
    {
    public:
        using HardwareStrategy::HardwareStrategy;

        void Setup() override;
        std::optional<HardwareReading> Read(common::TimePoint now) override;

    private:
        std::optional<common::TimePoint> m_lastChange;
    };

    // Output: relay, lock, siren.
    class GpioRelayStrategy : public HardwareStrategy
    {
    public:
        using HardwareStrategy::HardwareStrategy;

        void Setup() override;
        std::optional<HardwareReading> Read(common::TimePoint now) override;
        HardwareReading Execute(const std::string &command) override;

        HardwareReading Toggle();

    private:
        void Apply(bool on);

        std::mutex m_relayMutex;
        bool m_on = false;
    };

    // Throws HardwareError for an unknown driver name.
    std::shared_ptr<HardwareStrategy> CreateStrategy(const common::HardwareDefinition &definition,
                                                     std::shared_ptr<GpioDriver> gpio);
}
