#include "util/ByteFormat.hpp"

#include <array>
#include <format>

namespace util {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr std::array units{"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return std::format("{} B", bytes);
    }

    auto size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < units.size()) {
        size /= 1024.0;
        ++unit;
    }
    return std::format("{:.2f} {}", size, units[unit]);
}

auto format_rate(uint64_t bytes_per_sec) -> std::string {
    return format_bytes(bytes_per_sec) + "/s";
}

auto format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }

    const int64_t hours = seconds / 3600;
    const int64_t minutes = (seconds % 3600) / 60;
    const int64_t secs = seconds % 60;

    if (hours > 0) {
        return std::format("{}:{:02d}:{:02d}", hours, minutes, secs);
    }
    return std::format("{:02d}:{:02d}", minutes, secs);
}

}  // namespace util
