#pragma once

#include "sources/IByteSource.hpp"

/**
 * @class ZeroFillSource
 * @brief Produces a fixed number of 0x00 bytes without touching any file
 *
 * Used by the format operation, which zero-fills a device's full reported
 * capacity (or a configured fixed size).
 */
class ZeroFillSource : public IByteSource {
public:
    explicit ZeroFillSource(uint64_t size) : size_(size), remaining_(size) {}

    auto open() -> std::expected<void, TransferError> override;
    auto read(std::span<uint8_t> buffer) -> std::expected<size_t, TransferError> override;
    [[nodiscard]] auto size() const -> uint64_t override { return size_; }
    void close() override { remaining_ = size_; }
    [[nodiscard]] auto describe() const -> std::string override;

    [[nodiscard]] auto remaining() const -> uint64_t { return remaining_; }

private:
    uint64_t size_;
    uint64_t remaining_;
};
