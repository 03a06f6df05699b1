/**
 * @file IBlockDevice.hpp
 * @brief Interface for the removable medium a job writes to
 */

#pragma once

#include "models/TransferTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>

/**
 * @class IBlockDevice
 * @brief Sector-addressed target exclusively owned by one running job
 *
 * All offsets and lengths passed to write_at() by the engine are multiples
 * of sector_size(). Every call may block on media latency.
 */
class IBlockDevice {
public:
    virtual ~IBlockDevice() = default;

    /**
     * @brief Write data at a byte offset
     * @param offset Device byte offset
     * @param data Bytes to write
     * @return Bytes actually written, which may be fewer than requested;
     *         WRITE_ERROR when the write itself fails
     */
    [[nodiscard]] virtual auto write_at(uint64_t offset, std::span<const uint8_t> data)
        -> std::expected<size_t, TransferError> = 0;

    /**
     * @brief Read data at a byte offset
     * @return Bytes read (0 at end of device); READ_ERROR on failure
     */
    [[nodiscard]] virtual auto read_at(uint64_t offset, std::span<uint8_t> buffer)
        -> std::expected<size_t, TransferError> = 0;

    /**
     * @brief Push everything written so far to the medium
     */
    [[nodiscard]] virtual auto flush() -> std::expected<void, TransferError> = 0;

    [[nodiscard]] virtual auto capacity() const -> uint64_t = 0;

    [[nodiscard]] virtual auto sector_size() const -> uint32_t = 0;

    [[nodiscard]] virtual auto path() const -> const std::string& = 0;

    virtual void close() = 0;
};

/// How a job needs the target; verify-only jobs never write
enum class DeviceAccess { READ_WRITE, READ_ONLY };

/**
 * @brief Opens a target by path; replaced in tests by in-memory devices
 */
using BlockDeviceOpener = std::function<std::expected<std::unique_ptr<IBlockDevice>, TransferError>(
    const std::string&, DeviceAccess)>;
