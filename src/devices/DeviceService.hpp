#pragma once

#include "util/Result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief One line of the mount table
 */
struct MountEntry {
    std::string device;       // e.g., "/dev/sdb1"
    std::string mount_point;  // e.g., "/media/floppy"
    std::string filesystem;   // e.g., "vfat"

    auto operator==(const MountEntry&) const -> bool = default;
};

/**
 * @class DeviceService
 * @brief Prepares a target device before it is opened exclusively
 *
 * Floppies are routinely auto-mounted by the desktop, so every mount of the
 * device (or one of its partitions) is detached before a job writes to it.
 */
class DeviceService {
public:
    /**
     * @param mounts_file Mount table to consult, /proc/mounts unless testing
     */
    explicit DeviceService(std::string mounts_file = "/proc/mounts");

    /**
     * @brief Mount table entries that belong to the device or its partitions
     */
    [[nodiscard]] auto mounts_for(const std::string& device_path) const
        -> std::expected<std::vector<MountEntry>, util::Error>;

    [[nodiscard]] auto is_mounted(const std::string& device_path) const -> bool;

    /**
     * @brief Detach every mount of the device
     *
     * Tries a lazy unmount (MNT_DETACH) first and MNT_FORCE as fallback.
     *
     * @return Error naming the first mount point that is still attached
     */
    [[nodiscard]] auto unmount_device(const std::string& device_path)
        -> std::expected<void, util::Error>;

private:
    std::string mounts_file_;
};

/**
 * @brief True when @p mount_device is @p device_path or one of its partitions
 *
 * "/dev/sdb1" and "/dev/mmcblk0p1" belong to "/dev/sdb" and "/dev/mmcblk0";
 * "/dev/sdba" does not belong to "/dev/sdb".
 */
[[nodiscard]] auto mount_belongs_to(std::string_view mount_device, std::string_view device_path)
    -> bool;
