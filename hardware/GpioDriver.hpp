#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "../common/Config.hpp"

namespace hearth::hardware
{
    // Errors are reported as common::HardwareError.
    class GpioDriver
    {
    public:
        virtual ~GpioDriver() = default;

        virtual void Configure(int pin, bool output) = 0;
        virtual bool Read(int pin) = 0;
        virtual void Write(int pin, bool level) = 0;
    };

    // Legacy /sys/class/gpio interface.
    class SysfsGpioDriver : public GpioDriver
    {
    public:
        explicit SysfsGpioDriver(std::string root);

        void Configure(int pin, bool output) override;
        bool Read(int pin) override;
        void Write(int pin, bool level) override;

    private:
        std::string PinPath(int pin) const;
        void WriteFile(const std::string &path, const std::string &value);

        std::string m_root;
        std::mutex m_mutex;
    };

    // In-memory pins. SetInput() stands in for the outside world driving an input.
    class SimulatedGpioDriver : public GpioDriver
    {
    public:
        void Configure(int pin, bool output) override;
        bool Read(int pin) override;
        void Write(int pin, bool level) override;

        void SetInput(int pin, bool level);
        bool Level(int pin) const;
        bool IsConfigured(int pin) const;
        bool IsOutput(int pin) const;

    private:
        mutable std::mutex m_mutex;
        std::map<int, bool> m_levels;
        std::map<int, bool> m_outputs;
    };

    std::shared_ptr<GpioDriver> MakeGpioDriver(const common::HardwareConfig &config);
}
