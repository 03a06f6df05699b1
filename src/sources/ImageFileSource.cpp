#include "sources/ImageFileSource.hpp"

#include "util/IoHelpers.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>

ImageFileSource::ImageFileSource(Token, std::filesystem::path path, uint64_t size)
    : path_(std::move(path)), size_(size) {}

auto ImageFileSource::create(const std::filesystem::path& path)
    -> std::expected<std::unique_ptr<ImageFileSource>, TransferError> {
    if (path.empty()) {
        return std::unexpected(
            TransferError{.kind = ErrorKind::INVALID_ARGUMENT, .message = "Image path is empty"});
    }

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        const int err = errno;
        return std::unexpected(TransferError{
            .kind = ErrorKind::INVALID_ARGUMENT,
            .message = std::format("Cannot open image {}: {}", path.string(), std::strerror(err)),
            .os_error = err});
    }

    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(TransferError{
            .kind = ErrorKind::INVALID_ARGUMENT,
            .message = std::format("Image {} is not a regular file", path.string())});
    }

    if (st.st_size == 0) {
        return std::unexpected(
            TransferError{.kind = ErrorKind::INVALID_ARGUMENT,
                          .message = std::format("Image {} is empty", path.string())});
    }

    return std::make_unique<ImageFileSource>(Token{}, path, static_cast<uint64_t>(st.st_size));
}

auto ImageFileSource::open() -> std::expected<void, TransferError> {
    util::FileDescriptor fd{::open(path_.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd) {
        const int err = errno;
        return std::unexpected(TransferError{
            .kind = ErrorKind::SOURCE_READ_ERROR,
            .message = std::format("Cannot open image {}: {}", path_.string(), std::strerror(err)),
            .os_error = err});
    }

    fd_ = std::move(fd);
    position_ = 0;
    return {};
}

auto ImageFileSource::read(std::span<uint8_t> buffer) -> std::expected<size_t, TransferError> {
    if (!fd_) {
        return std::unexpected(TransferError{.kind = ErrorKind::SOURCE_READ_ERROR,
                                             .offset = position_,
                                             .message = "Image source is not open"});
    }

    const auto wanted =
        static_cast<size_t>(std::min<uint64_t>(buffer.size(), size_ - position_));
    size_t filled = 0;

    while (filled < wanted) {
        const auto n = util::read_with_retry(fd_.get(), buffer.data() + filled, wanted - filled);
        if (n < 0) {
            const int err = errno;
            return std::unexpected(TransferError{
                .kind = ErrorKind::SOURCE_READ_ERROR,
                .offset = position_ + filled,
                .message = std::format("Read from {} failed: {}", path_.string(), std::strerror(err)),
                .os_error = err});
        }
        if (n == 0) {
            return std::unexpected(TransferError{
                .kind = ErrorKind::SHORT_SOURCE,
                .offset = position_ + filled,
                .message = std::format("Image {} ended at {} bytes, expected {}", path_.string(),
                                       position_ + filled, size_)});
        }
        filled += static_cast<size_t>(n);
    }

    position_ += filled;
    return filled;
}

void ImageFileSource::close() {
    fd_.reset();
    position_ = 0;
}

auto ImageFileSource::describe() const -> std::string {
    return std::format("image {}", path_.filename().string());
}
