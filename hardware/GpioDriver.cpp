#include "GpioDriver.hpp"
#include "../common/Errors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

namespace hearth::hardware
{
    using common::HardwareError;

    SysfsGpioDriver::SysfsGpioDriver(std::string root) : m_root(std::move(root)) {}

    std::string SysfsGpioDriver::PinPath(int pin) const
    {
        return m_root + "/gpio" + std::to_string(pin);
    }

    void SysfsGpioDriver::WriteFile(const std::string &path, const std::string &value)
    {
        std::ofstream file(path);
        if (!file.is_open())
            throw HardwareError("cannot open " + path);
        file << value;
        file.flush();
        if (!file)
            throw HardwareError("write to " + path + " failed");
    }

    void SysfsGpioDriver::Configure(int pin, bool output)
    {
        if (pin < 0)
            throw HardwareError("invalid GPIO pin " + std::to_string(pin));

        std::lock_guard<std::mutex> lock(m_mutex);
        const std::string pinPath = PinPath(pin);
        if (!std::filesystem::exists(pinPath))
        {
            WriteFile(m_root + "/export", std::to_string(pin));
            // udev needs a moment to hand over the new node.
            for (int i = 0; i < 10 && !std::filesystem::exists(pinPath + "/direction"); ++i)
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        WriteFile(pinPath + "/direction", output ? "out" : "in");
    }

    bool SysfsGpioDriver::Read(int pin)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::string path = PinPath(pin) + "/value";
        std::ifstream file(path);
        if (!file.is_open())
            throw HardwareError("cannot open " + path);

        char c = '0';
        file >> c;
        if (!file)
            throw HardwareError("read from " + path + " failed");
        return c == '1';
    }

    void SysfsGpioDriver::Write(int pin, bool level)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        WriteFile(PinPath(pin) + "/value", level ? "1" : "0");
    }

    void SimulatedGpioDriver::Configure(int pin, bool output)
    {
        if (pin < 0)
            throw HardwareError("invalid GPIO pin " + std::to_string(pin));

        std::lock_guard<std::mutex> lock(m_mutex);
        m_outputs[pin] = output;
        // An input has no level until the test drives one with SetInput.
        if (output)
            m_levels.emplace(pin, false);
    }

    bool SimulatedGpioDriver::Read(int pin)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_levels.find(pin);
        if (it == m_levels.end())
            throw HardwareError("pin " + std::to_string(pin) + " is not configured");
        return it->second;
    }

    void SimulatedGpioDriver::Write(int pin, bool level)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outputs.find(pin);
        if (it == m_outputs.end() || !it->second)
            throw HardwareError("pin " + std::to_string(pin) + " is not an output");
        m_levels[pin] = level;
    }

    void SimulatedGpioDriver::SetInput(int pin, bool level)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_levels[pin] = level;
    }

    bool SimulatedGpioDriver::Level(int pin) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_levels.find(pin);
        return it != m_levels.end() && it->second;
    }

    bool SimulatedGpioDriver::IsConfigured(int pin) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_outputs.count(pin) > 0;
    }

    bool SimulatedGpioDriver::IsOutput(int pin) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outputs.find(pin);
        return it != m_outputs.end() && it->second;
    }

    std::shared_ptr<GpioDriver> MakeGpioDriver(const common::HardwareConfig &config)
    {
        if (config.gpio_backend == "simulated")
        {
            std::cout << "[Hardware] Using simulated GPIO\n";
            return std::make_shared<SimulatedGpioDriver>();
        }
        return std::make_shared<SysfsGpioDriver>(config.sysfs_root);
    }
}
