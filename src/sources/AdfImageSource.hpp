/**
 * @file AdfImageSource.hpp
 * @brief Amiga Disk File images
 *
 * An ADF file is a plain dump of the 512-byte sectors of an Amiga floppy,
 * so its bytes go to the device unchanged. What this variant adds is the
 * geometry check and a decode of the boot block for the job log.
 */

#pragma once

#include "sources/ImageFileSource.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>

/**
 * @struct AdfBootBlock
 * @brief Fields decoded from the first 1024 bytes of an ADF image
 */
struct AdfBootBlock {
    static constexpr size_t SIZE = 1024;

    bool has_dos_magic = false;   ///< Starts with "DOS"
    bool fast_file_system = false;
    bool international = false;
    bool dir_cache = false;
    uint32_t stored_checksum = 0;
    uint32_t computed_checksum = 0;

    /// A boot block is bootable when it carries the DOS magic and a valid checksum
    [[nodiscard]] auto is_bootable() const -> bool {
        return has_dos_magic && stored_checksum == computed_checksum;
    }

    [[nodiscard]] auto filesystem_name() const -> std::string;

    /**
     * @brief Decode a boot block
     * @param block First AdfBootBlock::SIZE bytes of the image
     */
    [[nodiscard]] static auto parse(std::span<const uint8_t, SIZE> block) -> AdfBootBlock;

    /**
     * @brief Amiga boot block checksum (ones' complement add-with-carry)
     *
     * The longword at offset 4 holds the checksum and is skipped.
     */
    [[nodiscard]] static auto compute_checksum(std::span<const uint8_t, SIZE> block) -> uint32_t;
};

/**
 * @class AdfImageSource
 * @brief Image source restricted to Amiga DD (880K) and HD (1760K) geometries
 */
class AdfImageSource : public ImageFileSource {
public:
    AdfImageSource(Token, std::filesystem::path path, uint64_t size, AdfBootBlock boot_block);

    /**
     * @brief Validate geometry and decode the boot block
     * @return INVALID_ARGUMENT if the size is not an Amiga floppy size
     */
    [[nodiscard]] static auto create(const std::filesystem::path& path)
        -> std::expected<std::unique_ptr<AdfImageSource>, TransferError>;

    [[nodiscard]] auto describe() const -> std::string override;

    [[nodiscard]] auto boot_block() const -> const AdfBootBlock& { return boot_block_; }
    [[nodiscard]] auto is_high_density() const -> bool;

private:
    AdfBootBlock boot_block_;
};
