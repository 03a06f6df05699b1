/**
 * @file FloppyGeometry.hpp
 * @brief Byte sizes of the floppy formats the tool knows about
 */

#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string_view>

namespace floppy {

constexpr uint32_t SECTOR_BYTES = 512;

constexpr uint64_t PC_720K = 737'280;      ///< 80 cyl, 2 heads, 9 sectors
constexpr uint64_t PC_1440K = 1'474'560;   ///< 80 cyl, 2 heads, 18 sectors
constexpr uint64_t PC_2880K = 2'949'120;   ///< 80 cyl, 2 heads, 36 sectors
constexpr uint64_t AMIGA_DD = 901'120;     ///< 80 cyl, 2 heads, 11 sectors
constexpr uint64_t AMIGA_HD = 1'802'240;   ///< 80 cyl, 2 heads, 22 sectors

struct NamedSize {
    std::string_view name;
    uint64_t bytes;
};

constexpr std::array STANDARD_SIZES{
    NamedSize{"720K", PC_720K},   NamedSize{"880K", AMIGA_DD},  NamedSize{"1440K", PC_1440K},
    NamedSize{"1760K", AMIGA_HD}, NamedSize{"2880K", PC_2880K},
};

[[nodiscard]] constexpr auto is_standard_size(uint64_t bytes) -> bool {
    for (const auto& entry : STANDARD_SIZES) {
        if (entry.bytes == bytes) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] constexpr auto is_amiga_size(uint64_t bytes) -> bool {
    return bytes == AMIGA_DD || bytes == AMIGA_HD;
}

/**
 * @brief Look up a size by its short name ("1440K", "720k", ...)
 */
[[nodiscard]] inline auto size_from_name(std::string_view name) -> std::optional<uint64_t> {
    const auto same = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    };
    for (const auto& entry : STANDARD_SIZES) {
        if (std::ranges::equal(entry.name, name, same)) {
            return entry.bytes;
        }
    }
    return std::nullopt;
}

}  // namespace floppy
