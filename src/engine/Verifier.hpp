/**
 * @file Verifier.hpp
 * @brief Read-back comparison of a device against its source
 */

#pragma once

#include "devices/IBlockDevice.hpp"
#include "sources/IByteSource.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

enum class VerifyStatus {
    MATCH,     ///< Every byte, padding included, is identical
    MISMATCH,  ///< First difference at VerifyResult::offset
    IO_ERROR,  ///< Source or device could not be read
    CANCELLED  ///< Stopped at a chunk boundary on request
};

struct VerifyResult {
    VerifyStatus status = VerifyStatus::MATCH;
    uint64_t offset = 0;                 ///< First mismatching byte
    std::optional<TransferError> error;  ///< Set for IO_ERROR
    uint64_t bytes_verified = 0;
};

/**
 * @class Verifier
 * @brief Compares the written region chunk by chunk and stops at the
 *        first difference
 *
 * The source is reopened from the beginning. The compared region is the
 * source size rounded up to the device sector size, and the bytes past the
 * end of the source must read back as zero.
 */
class Verifier {
public:
    /// Receives the number of source bytes verified so far
    using ProgressFn = std::function<void(uint64_t bytes_verified)>;

    /**
     * @param chunk_size Bytes per comparison, same as the write chunk
     * @param on_progress Called after every chunk
     */
    explicit Verifier(size_t chunk_size, ProgressFn on_progress = {});

    [[nodiscard]] auto verify(IByteSource& source, IBlockDevice& device,
                              const std::atomic<bool>& cancel_flag) -> VerifyResult;

private:
    [[nodiscard]] static auto read_device(IBlockDevice& device, uint64_t offset,
                                          std::span<uint8_t> buffer)
        -> std::expected<void, TransferError>;

    size_t chunk_size_;
    ProgressFn on_progress_;
};
