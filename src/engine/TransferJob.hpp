/**
 * @file TransferJob.hpp
 * @brief A single write, format or verify job and its tunables
 */

#pragma once

#include "devices/IBlockDevice.hpp"
#include "sources/IByteSource.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <string>

struct TransferOptions {
    static constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;
    static constexpr unsigned DEFAULT_MAX_WRITE_RETRIES = 3;

    size_t chunk_size = DEFAULT_CHUNK_SIZE;  ///< Must be a multiple of the sector size
    unsigned max_write_retries = DEFAULT_MAX_WRITE_RETRIES;  ///< Per chunk
    bool verify_after_write = false;
};

/**
 * @class FormatSizePolicy
 * @brief How many bytes a format (zero-fill) job writes
 */
class FormatSizePolicy {
public:
    enum class Kind { DEVICE_CAPACITY, FIXED };

    FormatSizePolicy() = default;

    [[nodiscard]] static auto device_capacity() -> FormatSizePolicy { return {}; }

    [[nodiscard]] static auto fixed(uint64_t bytes) -> FormatSizePolicy {
        FormatSizePolicy policy;
        policy.kind_ = Kind::FIXED;
        policy.bytes_ = bytes;
        return policy;
    }

    /**
     * @brief Zero-fill length for a device of the given capacity
     * @return CAPACITY_MISMATCH if a fixed size exceeds the capacity,
     *         INVALID_ARGUMENT if it is zero
     */
    [[nodiscard]] auto resolve(uint64_t capacity) const -> std::expected<uint64_t, TransferError> {
        if (kind_ == Kind::DEVICE_CAPACITY) {
            return capacity;
        }
        if (bytes_ == 0) {
            return std::unexpected(TransferError{.kind = ErrorKind::INVALID_ARGUMENT,
                                                 .message = "Format size must not be zero"});
        }
        if (bytes_ > capacity) {
            return std::unexpected(TransferError{
                .kind = ErrorKind::CAPACITY_MISMATCH,
                .message = std::format("Format size {} exceeds device capacity {}", bytes_,
                                       capacity)});
        }
        return bytes_;
    }

    [[nodiscard]] auto kind() const -> Kind { return kind_; }
    [[nodiscard]] auto bytes() const -> uint64_t { return bytes_; }

    auto operator==(const FormatSizePolicy&) const -> bool = default;

private:
    Kind kind_ = Kind::DEVICE_CAPACITY;
    uint64_t bytes_ = 0;
};

/**
 * @struct TransferJob
 * @brief Everything one engine run needs; source and target are owned
 */
struct TransferJob {
    uint64_t id = 0;
    TransferMode mode = TransferMode::WRITE;
    std::unique_ptr<IByteSource> source;
    std::unique_ptr<IBlockDevice> target;
    TransferOptions options;
};
