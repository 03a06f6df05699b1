#pragma once

#include "models/TransferTypes.hpp"

#include <array>
#include <cctype>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace device_policy {

// Floppy drives, USB floppy/flash readers and virtio disks used for testing
constexpr std::array ALLOWED_PREFIXES{
    std::string_view{"/dev/fd"},      std::string_view{"/dev/floppy/"},
    std::string_view{"/dev/sd"},      std::string_view{"/dev/mmcblk"},
    std::string_view{"/dev/vd"},
};

/**
 * @brief Reject target paths the tool must never write to
 * @param path Target path
 * @param allow_regular_files Also admit existing regular files
 */
inline auto validate_target_path(const std::string& path, bool allow_regular_files)
    -> std::expected<void, TransferError> {
    if (path.empty()) {
        return std::unexpected(
            TransferError{.kind = ErrorKind::INVALID_ARGUMENT, .message = "Device path is empty"});
    }

    if (path.find("..") != std::string::npos) {
        return std::unexpected(TransferError{
            .kind = ErrorKind::INVALID_ARGUMENT,
            .message = std::format("Device path {} contains '..'", path)});
    }

    for (const auto prefix : ALLOWED_PREFIXES) {
        if (path.starts_with(prefix) && path.size() > prefix.size()) {
            return {};
        }
    }

    if (allow_regular_files) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            return {};
        }
        return std::unexpected(TransferError{
            .kind = ErrorKind::DEVICE_NOT_FOUND,
            .message = std::format("{} is neither a supported device nor a regular file", path)});
    }

    return std::unexpected(TransferError{
        .kind = ErrorKind::INVALID_ARGUMENT,
        .message = std::format("{} is not a supported removable device path", path)});
}

using PathExists = std::function<bool(const std::string&)>;

/**
 * @brief Map a DOS-style drive letter to its Linux device node
 *
 * A is /dev/fd0 (or /dev/floppy/0 under devfs-style naming), B is /dev/fd1.
 *
 * @param letter 'A' or 'B', either case
 * @param exists Existence probe, std::filesystem::exists by default
 */
inline auto resolve_drive_letter(char letter, const PathExists& exists = {})
    -> std::expected<std::string, TransferError> {
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
    if (upper != 'A' && upper != 'B') {
        return std::unexpected(TransferError{
            .kind = ErrorKind::INVALID_ARGUMENT,
            .message = std::format("Drive {}: is not a floppy drive letter", letter)});
    }

    const int index = upper - 'A';
    const std::array candidates{std::format("/dev/fd{}", index),
                                std::format("/dev/floppy/{}", index)};

    for (const auto& candidate : candidates) {
        const bool found = exists ? exists(candidate) : [&candidate] {
            std::error_code ec;
            return std::filesystem::exists(candidate, ec);
        }();
        if (found) {
            return candidate;
        }
    }

    return std::unexpected(TransferError{
        .kind = ErrorKind::DEVICE_NOT_FOUND,
        .message = std::format("No device node for drive {}: (tried {} and {})", upper,
                               candidates[0], candidates[1])});
}

}  // namespace device_policy
