#include "TimeUtil.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hearth::common
{
    int64_t ToMillis(TimePoint tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    TimePoint FromMillis(int64_t ms)
    {
        return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
    }

    static std::tm LocalTm(TimePoint tp)
    {
        std::time_t t = Clock::to_time_t(tp);
        std::tm out{};
        localtime_r(&t, &out);
        return out;
    }

    int HourOfDay(TimePoint tp)
    {
        return LocalTm(tp).tm_hour;
    }

    std::string FormatTimestamp(TimePoint tp)
    {
        std::tm tm = LocalTm(tp);
        std::stringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }
}
