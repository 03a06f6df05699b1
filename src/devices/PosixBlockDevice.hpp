#pragma once

#include "devices/IBlockDevice.hpp"
#include "util/FileDescriptor.hpp"

/**
 * @class PosixBlockDevice
 * @brief IBlockDevice over a Linux block device node (or a plain file)
 *
 * Block devices are opened O_RDWR | O_SYNC | O_EXCL, so the kernel refuses
 * the open with EBUSY while the device is mounted or held exclusively by
 * another process. READ_ONLY access opens O_RDONLY | O_EXCL instead and
 * rejects every write_at(). Capacity comes from BLKGETSIZE64 and the sector
 * size from BLKSSZGET.
 */
class PosixBlockDevice : public IBlockDevice {
    struct Token {
        explicit Token() = default;
    };

public:
    struct Options {
        bool allow_regular_files = false;  ///< Accept a regular file as the target
        DeviceAccess access = DeviceAccess::READ_WRITE;
    };

    /// Only open() can build a Token
    PosixBlockDevice(Token, std::string path, util::FileDescriptor fd, uint64_t capacity,
                     uint32_t sector_size, bool is_block_device, DeviceAccess access);

    /**
     * @brief Open a target
     * @param path Device node, e.g. /dev/fd0
     * @param options Open options
     * @return Device, or DEVICE_NOT_FOUND / DEVICE_BUSY / PERMISSION_DENIED /
     *         INVALID_ARGUMENT mapped from the failing call
     */
    [[nodiscard]] static auto open(const std::string& path, Options options)
        -> std::expected<std::unique_ptr<PosixBlockDevice>, TransferError>;

    /**
     * @brief Opener bound to the given options, for TransferService
     *
     * The access mode passed to the opener overrides options.access.
     */
    [[nodiscard]] static auto opener(Options options) -> BlockDeviceOpener;

    auto write_at(uint64_t offset, std::span<const uint8_t> data)
        -> std::expected<size_t, TransferError> override;
    auto read_at(uint64_t offset, std::span<uint8_t> buffer)
        -> std::expected<size_t, TransferError> override;
    auto flush() -> std::expected<void, TransferError> override;
    [[nodiscard]] auto capacity() const -> uint64_t override { return capacity_; }
    [[nodiscard]] auto sector_size() const -> uint32_t override { return sector_size_; }
    [[nodiscard]] auto path() const -> const std::string& override { return path_; }
    void close() override;

    [[nodiscard]] auto is_block_device() const -> bool { return is_block_device_; }
    [[nodiscard]] auto access() const -> DeviceAccess { return access_; }

private:
    std::string path_;
    util::FileDescriptor fd_;
    uint64_t capacity_;
    uint32_t sector_size_;
    bool is_block_device_;
    DeviceAccess access_;
};

/**
 * @brief Map an errno from open() to the error kind reported to the user
 */
[[nodiscard]] auto error_kind_for_open_errno(int err) -> ErrorKind;
