#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace hearth::common
{
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    int64_t ToMillis(TimePoint tp);
    TimePoint FromMillis(int64_t ms);

    // Local hour of day, 0-23.
    int HourOfDay(TimePoint tp);

    // "2026-10-17 08:15:02" in local time, for log lines.
    std::string FormatTimestamp(TimePoint tp);
}
