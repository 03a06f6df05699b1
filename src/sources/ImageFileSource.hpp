#pragma once

#include "sources/IByteSource.hpp"
#include "util/FileDescriptor.hpp"

#include <filesystem>
#include <memory>

/**
 * @class ImageFileSource
 * @brief Raw disk image read sequentially from a regular file
 *
 * The size is taken from the file when the source is created. If the file
 * shrinks afterwards, read() fails with SHORT_SOURCE instead of silently
 * producing fewer bytes. Bytes beyond the declared size are never read.
 */
class ImageFileSource : public IByteSource {
protected:
    /// Only create() and subclasses can build a Token
    struct Token {
        explicit Token() = default;
    };

public:
    ImageFileSource(Token, std::filesystem::path path, uint64_t size);

    /**
     * @brief Validate the path and capture the image size
     * @param path Image file
     * @return Source, or INVALID_ARGUMENT when the path is missing, not a
     *         regular file, or empty
     */
    [[nodiscard]] static auto create(const std::filesystem::path& path)
        -> std::expected<std::unique_ptr<ImageFileSource>, TransferError>;

    auto open() -> std::expected<void, TransferError> override;
    auto read(std::span<uint8_t> buffer) -> std::expected<size_t, TransferError> override;
    [[nodiscard]] auto size() const -> uint64_t override { return size_; }
    void close() override;
    [[nodiscard]] auto describe() const -> std::string override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
    uint64_t size_;
    uint64_t position_ = 0;
    util::FileDescriptor fd_;
};
