#include "sources/AdfImageSource.hpp"

#include "models/FloppyGeometry.hpp"
#include "util/FileDescriptor.hpp"
#include "util/IoHelpers.hpp"

#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <format>

namespace {

constexpr uint8_t FLAG_FFS = 0x01;
constexpr uint8_t FLAG_INTL = 0x02;
constexpr uint8_t FLAG_DIRCACHE = 0x04;

auto read_be32(std::span<const uint8_t> bytes, size_t offset) -> uint32_t {
    return (static_cast<uint32_t>(bytes[offset]) << 24) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 8) |
           static_cast<uint32_t>(bytes[offset + 3]);
}

}  // namespace

auto AdfBootBlock::compute_checksum(std::span<const uint8_t, SIZE> block) -> uint32_t {
    uint32_t sum = 0;
    for (size_t offset = 0; offset < SIZE; offset += 4) {
        if (offset == 4) {
            continue;
        }
        const uint32_t value = read_be32(block, offset);
        const uint32_t next = sum + value;
        // Carry wraps around into bit 0
        sum = (next < sum) ? next + 1 : next;
    }
    return ~sum;
}

auto AdfBootBlock::parse(std::span<const uint8_t, SIZE> block) -> AdfBootBlock {
    AdfBootBlock result;
    result.has_dos_magic = block[0] == 'D' && block[1] == 'O' && block[2] == 'S';
    if (result.has_dos_magic) {
        const uint8_t flags = block[3];
        result.fast_file_system = (flags & FLAG_FFS) != 0;
        result.international = (flags & FLAG_INTL) != 0;
        result.dir_cache = (flags & FLAG_DIRCACHE) != 0;
    }
    result.stored_checksum = read_be32(block, 4);
    result.computed_checksum = compute_checksum(block);
    return result;
}

auto AdfBootBlock::filesystem_name() const -> std::string {
    if (!has_dos_magic) {
        return "non-DOS";
    }
    std::string name = fast_file_system ? "FFS" : "OFS";
    if (dir_cache) {
        name += "+DirCache";
    } else if (international) {
        name += "+Intl";
    }
    return name;
}

AdfImageSource::AdfImageSource(Token token, std::filesystem::path path, uint64_t size,
                               AdfBootBlock boot_block)
    : ImageFileSource(token, std::move(path), size), boot_block_(boot_block) {}

auto AdfImageSource::create(const std::filesystem::path& path)
    -> std::expected<std::unique_ptr<AdfImageSource>, TransferError> {
    auto base = ImageFileSource::create(path);
    if (!base) {
        return std::unexpected(base.error());
    }

    const uint64_t size = (*base)->size();
    if (!floppy::is_amiga_size(size)) {
        return std::unexpected(TransferError{
            .kind = ErrorKind::INVALID_ARGUMENT,
            .message = std::format("{} is {} bytes; an ADF image must be {} (DD) or {} (HD)",
                                   path.filename().string(), size, floppy::AMIGA_DD,
                                   floppy::AMIGA_HD)});
    }

    util::FileDescriptor fd{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd) {
        const int err = errno;
        return std::unexpected(TransferError{
            .kind = ErrorKind::SOURCE_READ_ERROR,
            .message = std::format("Cannot open image {}: {}", path.string(), std::strerror(err)),
            .os_error = err});
    }

    std::array<uint8_t, AdfBootBlock::SIZE> block{};
    const auto n = util::pread_with_retry(fd.get(), block.data(), block.size(), 0);
    if (n != static_cast<ssize_t>(block.size())) {
        const int err = n < 0 ? errno : 0;
        return std::unexpected(TransferError{
            .kind = n < 0 ? ErrorKind::SOURCE_READ_ERROR : ErrorKind::SHORT_SOURCE,
            .message = std::format("Cannot read boot block of {}", path.string()),
            .os_error = err});
    }

    return std::make_unique<AdfImageSource>(Token{}, path, size, AdfBootBlock::parse(block));
}

auto AdfImageSource::is_high_density() const -> bool {
    return size() == floppy::AMIGA_HD;
}

auto AdfImageSource::describe() const -> std::string {
    return std::format("Amiga {} image {} ({}, {})", is_high_density() ? "HD" : "DD",
                       path().filename().string(), boot_block_.filesystem_name(),
                       boot_block_.is_bootable() ? "bootable" : "not bootable");
}
