#include "time_utils.hpp"
#include <fmt/format.h>
#include <cmath>
#include <cstdint>

static bool usable(double seconds) {
    return std::isfinite(seconds) && seconds >= 0.0;
}

std::string format_duration(double seconds) {
    if (!usable(seconds)) return "-";

    auto total = static_cast<int64_t>(seconds);
    int64_t days = total / 86400;
    int64_t hours = (total % 86400) / 3600;
    int64_t mins = (total % 3600) / 60;
    int64_t secs = total % 60;

    if (days > 0) {
        return fmt::format("{}d{}h", days, hours);
    } else if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_sim_time(double seconds) {
    if (!usable(seconds)) return "-";

    auto total = static_cast<int64_t>(seconds);
    int64_t days = total / 86400;
    int64_t hours = (total % 86400) / 3600;
    int64_t mins = (total % 3600) / 60;
    int64_t secs = total % 60;

    if (days > 0) {
        return fmt::format("{}d {:02}:{:02}:{:02}", days, hours, mins, secs);
    }
    return fmt::format("{:02}:{:02}:{:02}", hours, mins, secs);
}
