#include "devices/PosixBlockDevice.hpp"

#include "models/FloppyGeometry.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>

auto error_kind_for_open_errno(int err) -> ErrorKind {
    switch (err) {
        case EBUSY:
        case ETXTBSY:
            return ErrorKind::DEVICE_BUSY;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorKind::PERMISSION_DENIED;
        case ENOENT:
        case ENXIO:
        case ENODEV:
        case ENOMEDIUM:
            return ErrorKind::DEVICE_NOT_FOUND;
        default:
            return ErrorKind::INVALID_ARGUMENT;
    }
}

PosixBlockDevice::PosixBlockDevice(Token, std::string path, util::FileDescriptor fd,
                                   uint64_t capacity, uint32_t sector_size, bool is_block_device,
                                   DeviceAccess access)
    : path_(std::move(path)), fd_(std::move(fd)), capacity_(capacity),
      sector_size_(sector_size), is_block_device_(is_block_device), access_(access) {}

auto PosixBlockDevice::open(const std::string& path, Options options)
    -> std::expected<std::unique_ptr<PosixBlockDevice>, TransferError> {
    const auto fail = [&path](int err, std::string_view what) {
        return std::unexpected(TransferError{
            .kind = error_kind_for_open_errno(err),
            .message = std::format("{} {}: {}", what, path, std::strerror(err)),
            .os_error = err});
    };

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return fail(errno, "Cannot access");
    }

    const bool is_block = S_ISBLK(st.st_mode);
    if (!is_block && !(S_ISREG(st.st_mode) && options.allow_regular_files)) {
        return std::unexpected(TransferError{
            .kind = ErrorKind::INVALID_ARGUMENT,
            .message = std::format("{} is not a block device", path)});
    }

    const bool read_only = options.access == DeviceAccess::READ_ONLY;
    int flags = (read_only ? O_RDONLY : O_RDWR) | O_CLOEXEC;
    if (is_block) {
        // O_EXCL still keeps a mounted filesystem from changing under the verifier
        flags |= read_only ? O_EXCL : O_SYNC | O_EXCL;
    }

    util::FileDescriptor fd{::open(path.c_str(), flags)};
    if (!fd) {
        return fail(errno, "Cannot open");
    }

    uint64_t capacity = 0;
    uint32_t sector_size = floppy::SECTOR_BYTES;

    if (is_block) {
        if (::ioctl(fd.get(), BLKGETSIZE64, &capacity) != 0) {
            return fail(errno, "Cannot query size of");
        }
        int logical_sector = 0;
        if (::ioctl(fd.get(), BLKSSZGET, &logical_sector) == 0 && logical_sector > 0) {
            sector_size = static_cast<uint32_t>(logical_sector);
        } else {
            LOG_WARNING("PosixBlockDevice",
                        std::format("BLKSSZGET failed on {}, assuming {} byte sectors", path,
                                    sector_size));
        }
    } else {
        capacity = static_cast<uint64_t>(st.st_size);
    }

    LOG_INFO("PosixBlockDevice", std::format("Opened {} ({} bytes, {} byte sectors{}{})", path,
                                             capacity, sector_size,
                                             is_block ? "" : ", regular file",
                                             read_only ? ", read-only" : ""));

    return std::make_unique<PosixBlockDevice>(Token{}, path, std::move(fd), capacity, sector_size,
                                              is_block, options.access);
}

auto PosixBlockDevice::opener(Options options) -> BlockDeviceOpener {
    return [options](const std::string& path, DeviceAccess access)
               -> std::expected<std::unique_ptr<IBlockDevice>, TransferError> {
        auto bound = options;
        bound.access = access;
        auto device = PosixBlockDevice::open(path, bound);
        if (!device) {
            return std::unexpected(device.error());
        }
        return std::unique_ptr<IBlockDevice>(std::move(*device));
    };
}

auto PosixBlockDevice::write_at(uint64_t offset, std::span<const uint8_t> data)
    -> std::expected<size_t, TransferError> {
    if (!fd_) {
        return std::unexpected(TransferError{
            .kind = ErrorKind::WRITE_ERROR, .offset = offset, .message = "Device is closed"});
    }
    if (access_ == DeviceAccess::READ_ONLY) {
        return std::unexpected(TransferError{
            .kind = ErrorKind::WRITE_ERROR,
            .offset = offset,
            .message = std::format("{} is open read-only", path_)});
    }
    if (offset > capacity_ || data.size() > capacity_ - offset) {
        return std::unexpected(TransferError{
            .kind = ErrorKind::WRITE_ERROR,
            .offset = offset,
            .message = std::format("Write of {} bytes at {} exceeds capacity {}", data.size(),
                                   offset, capacity_)});
    }

    const auto n = util::pwrite_with_retry(fd_.get(), data.data(), data.size(), offset);
    if (n < 0) {
        const int err = errno;
        return std::unexpected(TransferError{
            .kind = ErrorKind::WRITE_ERROR,
            .offset = offset,
            .message = std::format("Write to {} at offset {} failed: {}", path_, offset,
                                   std::strerror(err)),
            .os_error = err});
    }
    return static_cast<size_t>(n);
}

auto PosixBlockDevice::read_at(uint64_t offset, std::span<uint8_t> buffer)
    -> std::expected<size_t, TransferError> {
    if (!fd_) {
        return std::unexpected(TransferError{
            .kind = ErrorKind::READ_ERROR, .offset = offset, .message = "Device is closed"});
    }

    const auto n = util::pread_with_retry(fd_.get(), buffer.data(), buffer.size(), offset);
    if (n < 0) {
        const int err = errno;
        return std::unexpected(TransferError{
            .kind = ErrorKind::READ_ERROR,
            .offset = offset,
            .message = std::format("Read from {} at offset {} failed: {}", path_, offset,
                                   std::strerror(err)),
            .os_error = err});
    }
    return static_cast<size_t>(n);
}

auto PosixBlockDevice::flush() -> std::expected<void, TransferError> {
    if (::fsync(fd_.get()) == 0) {
        return {};
    }

    const int err = errno;
    if (err == EINVAL) {
        // Some USB floppy drivers do not implement flush; O_SYNC already applied
        LOG_DEBUG("PosixBlockDevice", std::format("fsync not supported on {}, ignored", path_));
        return {};
    }
    return std::unexpected(TransferError{
        .kind = ErrorKind::FLUSH_ERROR,
        .message = std::format("Flush of {} failed: {}", path_, std::strerror(err)),
        .os_error = err});
}

void PosixBlockDevice::close() {
    if (fd_.reset() != 0) {
        LOG_WARNING("PosixBlockDevice",
                    std::format("close({}) failed: {}", path_, std::strerror(errno)));
    }
}
