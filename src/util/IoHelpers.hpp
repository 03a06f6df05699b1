#pragma once

#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>

namespace util {

// Positional I/O that restarts on EINTR. A short count is returned as-is;
// callers decide whether to loop.

inline auto pwrite_with_retry(int fd, const void* buffer, size_t size, uint64_t offset)
    -> ssize_t {
    while (true) {
        const auto result = ::pwrite(fd, buffer, size, static_cast<off_t>(offset));
        if (result < 0 && errno == EINTR) {
            continue;
        }
        return result;
    }
}

inline auto pread_with_retry(int fd, void* buffer, size_t size, uint64_t offset) -> ssize_t {
    while (true) {
        const auto result = ::pread(fd, buffer, size, static_cast<off_t>(offset));
        if (result < 0 && errno == EINTR) {
            continue;
        }
        return result;
    }
}

inline auto read_with_retry(int fd, void* buffer, size_t size) -> ssize_t {
    while (true) {
        const auto result = ::read(fd, buffer, size);
        if (result < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        return result;
    }
}

}  // namespace util
