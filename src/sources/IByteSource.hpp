/**
 * @file IByteSource.hpp
 * @brief Interface for the data a job writes to, or compares against, a device
 */

#pragma once

#include "models/TransferTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

/**
 * @class IByteSource
 * @brief Finite stream of bytes with a size fixed at construction
 *
 * A source owns no device resources. It is opened when a job starts,
 * reopened from the beginning by the verifier, and closed when the job
 * ends. Sources are used by one thread at a time.
 */
class IByteSource {
public:
    virtual ~IByteSource() = default;

    /**
     * @brief Open (or rewind) the source so the next read starts at byte 0
     * @return Error if the underlying file cannot be opened
     */
    [[nodiscard]] virtual auto open() -> std::expected<void, TransferError> = 0;

    /**
     * @brief Read up to buffer.size() bytes
     * @param buffer Destination
     * @return Number of bytes produced; 0 means end of stream.
     *         SHORT_SOURCE if the data ends before size() bytes were produced.
     */
    [[nodiscard]] virtual auto read(std::span<uint8_t> buffer)
        -> std::expected<size_t, TransferError> = 0;

    /**
     * @brief Total number of bytes the source will produce
     */
    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    virtual void close() = 0;

    /**
     * @brief One-line description for logs ("image floppy.img", "zero fill")
     */
    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};
