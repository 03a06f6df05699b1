/**
 * @file ByteFormat.hpp
 * @brief Human-readable sizes, rates and durations
 */

#pragma once

#include <cstdint>
#include <string>

namespace util {

/**
 * @brief Format a byte count, e.g. "512 B", "1.41 MB"
 *
 * Uses binary units. Plain bytes are printed without decimals,
 * larger units with two.
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format a transfer rate, e.g. "28.13 KB/s"
 */
[[nodiscard]] auto format_rate(uint64_t bytes_per_sec) -> std::string;

/**
 * @brief Format seconds as "mm:ss" or "h:mm:ss"; negative yields "--:--"
 */
[[nodiscard]] auto format_duration(int64_t seconds) -> std::string;

}  // namespace util
