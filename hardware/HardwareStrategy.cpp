#include "HardwareStrategy.hpp"
#include "../common/Errors.hpp"
#include <iostream>

namespace hearth::hardware
{
    using common::HardwareError;

    HardwareStrategy::HardwareStrategy(common::HardwareDefinition definition, std::shared_ptr<GpioDriver> gpio)
        : m_definition(std::move(definition)), m_gpio(std::move(gpio))
    {
        m_current.label = m_definition.inactive_label;
        m_current.unit = "boolean";
    }

    HardwareStrategy::~HardwareStrategy()
    {
        std::cout << "[Hardware] Released " << m_definition.id << "\n";
    }

    HardwareReading HardwareStrategy::Execute(const std::string &command)
    {
        throw HardwareError("'" + m_definition.id + "' does not support command '" + command + "'");
    }

    HardwareReading HardwareStrategy::Current() const
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_current;
    }

    std::optional<common::TimePoint> HardwareStrategy::LastActivity() const
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_lastActivity;
    }

    void HardwareStrategy::SetCurrent(const HardwareReading &reading, common::TimePoint when)
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_current = reading;
        m_lastActivity = when;
    }

    std::string HardwareStrategy::LabelFor(bool active) const
    {
        return active ? m_definition.active_label : m_definition.inactive_label;
    }

    void GpioBinaryStrategy::Setup()
    {
        m_gpio->Configure(m_definition.pin, false);
    }

    std::optional<HardwareReading> GpioBinaryStrategy::Read(common::TimePoint now)
    {
        const bool level = m_gpio->Read(m_definition.pin);
        const bool active = level == m_definition.active_high;
        const double value = active ? 1.0 : 0.0;

        if (value == Current().value)
            return std::nullopt;

        if (m_lastChange)
        {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - *m_lastChange);
            if (elapsed.count() <= m_definition.debounce_ms)
                return std::nullopt;
        }

        m_lastChange = now;
        HardwareReading reading{value, LabelFor(active), "boolean"};
        SetCurrent(reading, now);
        return reading;
    }

    void GpioRelayStrategy::Apply(bool on)
    {
        const bool level = on == m_definition.active_high;
        m_gpio->Write(m_definition.pin, level);
        m_on = on;
        SetCurrent({on ? 1.0 : 0.0, LabelFor(on), "boolean"}, common::Clock::now());
    }

    void GpioRelayStrategy::Setup()
    {
        std::lock_guard<std::mutex> lock(m_relayMutex);
        m_gpio->Configure(m_definition.pin, true);
        Apply(m_definition.default_on);
    }

    std::optional<HardwareReading> GpioRelayStrategy::Read(common::TimePoint)
    {
        return std::nullopt;
    }

    HardwareReading GpioRelayStrategy::Toggle()
    {
        std::lock_guard<std::mutex> lock(m_relayMutex);
        Apply(!m_on);
        return Current();
    }

    HardwareReading GpioRelayStrategy::Execute(const std::string &command)
    {
        if (command == "toggle")
            return Toggle();
        return HardwareStrategy::Execute(command);
    }

    std::shared_ptr<HardwareStrategy> CreateStrategy(const common::HardwareDefinition &definition,
                                                     std::shared_ptr<GpioDriver> gpio)
    {
        if (definition.driver == "gpio_binary")
            return std::make_shared<GpioBinaryStrategy>(definition, std::move(gpio));
        if (definition.driver == "gpio_relay")
            return std::make_shared<GpioRelayStrategy>(definition, std::move(gpio));
        throw HardwareError("unknown driver '" + definition.driver + "' for " + definition.id);
    }
}
