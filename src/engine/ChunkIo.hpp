#pragma once

#include "sources/IByteSource.hpp"

#include <cstdint>
#include <format>
#include <span>

namespace chunk_io {

[[nodiscard]] constexpr auto round_up(uint64_t value, uint64_t multiple) -> uint64_t {
    return multiple == 0 ? value : ((value + multiple - 1) / multiple) * multiple;
}

[[nodiscard]] constexpr auto round_down(uint64_t value, uint64_t multiple) -> uint64_t {
    return multiple == 0 ? value : (value / multiple) * multiple;
}

/**
 * @brief Fill @p buffer completely from @p source
 * @param offset Stream offset of buffer[0], used in error reports
 * @return SHORT_SOURCE if the stream ends before the buffer is full
 */
[[nodiscard]] inline auto read_exact(IByteSource& source, std::span<uint8_t> buffer,
                                     uint64_t offset) -> std::expected<void, TransferError> {
    size_t filled = 0;
    while (filled < buffer.size()) {
        auto n = source.read(buffer.subspan(filled));
        if (!n) {
            return std::unexpected(n.error());
        }
        if (*n == 0) {
            return std::unexpected(TransferError{
                .kind = ErrorKind::SHORT_SOURCE,
                .offset = offset + filled,
                .message = std::format("{} ended at {} bytes, expected {}", source.describe(),
                                       offset + filled, source.size())});
        }
        filled += *n;
    }
    return {};
}

}  // namespace chunk_io
