#include "api/timeline_format.hpp"

#include <cmath>
#include <cstdio>

namespace api {

std::string format_position_ms(double ms) {
    if (!std::isfinite(ms) || ms < 0.0) {
        ms = 0.0;
    }
    char buf[48];
    if (ms < 1000.0) {
        std::snprintf(buf, sizeof(buf), "%lldms", static_cast<long long>(std::llround(ms)));
    } else if (ms < 60000.0) {
        std::snprintf(buf, sizeof(buf), "%.1fs", ms / 1000.0);
    } else {
        // Round to whole seconds first so 119.6s reads 2:00, not 1:60.
        const long long total_sec = std::llround(ms / 1000.0);
        std::snprintf(buf, sizeof(buf), "%lld:%02lld", total_sec / 60, total_sec % 60);
    }
    return buf;
}

std::string format_cost(double cost) {
    if (!std::isfinite(cost) || cost < 0.001) {
        return "<$0.001";
    }
    char buf[48];
    std::snprintf(buf, sizeof(buf), "$%.4f", cost);
    return buf;
}

std::string format_duration(std::optional<std::int64_t> ms) {
    if (!ms) {
        return "-";
    }
    char buf[48];
    if (*ms < 1000) {
        std::snprintf(buf, sizeof(buf), "%lldms", static_cast<long long>(*ms));
        return buf;
    }
    const long long total_sec = *ms / 1000;
    if (total_sec < 60) {
        std::snprintf(buf, sizeof(buf), "%llds", total_sec);
        return buf;
    }
    const long long minutes = total_sec / 60;
    const long long seconds = total_sec % 60;
    if (minutes < 60) {
        if (seconds > 0) {
            std::snprintf(buf, sizeof(buf), "%lldm %llds", minutes, seconds);
        } else {
            std::snprintf(buf, sizeof(buf), "%lldm", minutes);
        }
        return buf;
    }
    const long long hours = minutes / 60;
    const long long rem_minutes = minutes % 60;
    if (rem_minutes > 0) {
        std::snprintf(buf, sizeof(buf), "%lldh %lldm", hours, rem_minutes);
    } else {
        std::snprintf(buf, sizeof(buf), "%lldh", hours);
    }
    return buf;
}

std::string format_speed(double speed) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%gx", speed);
    return buf;
}

std::string format_speed_presets(std::span<const double> presets) {
    std::string out;
    for (const double p : presets) {
        if (!out.empty()) {
            out += ' ';
        }
        out += format_speed(p);
    }
    return out;
}

} // namespace api
