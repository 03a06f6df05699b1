#include "sources/ZeroFillSource.hpp"

#include "util/ByteFormat.hpp"

#include <algorithm>
#include <cstring>
#include <format>

auto ZeroFillSource::open() -> std::expected<void, TransferError> {
    remaining_ = size_;
    return {};
}

auto ZeroFillSource::read(std::span<uint8_t> buffer) -> std::expected<size_t, TransferError> {
    const auto n = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining_));
    if (n > 0) {
        std::memset(buffer.data(), 0, n);
        remaining_ -= n;
    }
    return n;
}

auto ZeroFillSource::describe() const -> std::string {
    return std::format("zero fill of {}", util::format_bytes(size_));
}
