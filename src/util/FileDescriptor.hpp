/**
 * @file FileDescriptor.hpp
 * @brief Owning handle for POSIX file descriptors
 */

#pragma once

#include <unistd.h>

#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Move-only owner of a raw descriptor, closed on destruction
 *
 * Image sources and block devices keep their descriptor in one of these so
 * that every early return on an error path still releases the handle.
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;

    /**
     * @brief Take ownership of a raw descriptor
     * @param fd Raw file descriptor (negative means "none")
     */
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    /**
     * @brief Close the owned descriptor (if any) and adopt a new one
     * @param fd New raw descriptor, -1 to leave the handle empty
     * @return Result of ::close() on the previous descriptor, 0 if none
     */
    auto reset(int fd = -1) noexcept -> int {
        int rc = 0;
        if (fd_ >= 0) {
            rc = ::close(fd_);
        }
        fd_ = fd;
        return rc;
    }

    /**
     * @brief Give up ownership without closing
     * @return The raw descriptor previously owned
     */
    [[nodiscard]] auto release() noexcept -> int { return std::exchange(fd_, -1); }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

private:
    int fd_ = -1;
};

}  // namespace util
