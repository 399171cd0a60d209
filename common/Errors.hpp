#pragma once

#include <stdexcept>
#include <string>

namespace hearth::common
{
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
    };

    class StoreError : public std::runtime_error
    {
    public:
        explicit StoreError(const std::string &msg) : std::runtime_error(msg) {}
    };

    class HardwareError : public std::runtime_error
    {
    public:
        explicit HardwareError(const std::string &msg) : std::runtime_error(msg) {}
    };
}
