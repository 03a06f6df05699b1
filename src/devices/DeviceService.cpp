#include "devices/DeviceService.hpp"

#include "util/Logger.hpp"

#include <sys/mount.h>

#include <mntent.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <memory>

namespace {

struct MountTableCloser {
    void operator()(FILE* f) const {
        if (f) {
            ::endmntent(f);
        }
    }
};

using MountTable = std::unique_ptr<FILE, MountTableCloser>;

}  // namespace

auto mount_belongs_to(std::string_view mount_device, std::string_view device_path) -> bool {
    if (mount_device == device_path) {
        return true;
    }
    if (!mount_device.starts_with(device_path) || mount_device.size() == device_path.size()) {
        return false;
    }
    const auto suffix = mount_device.substr(device_path.size());
    const auto first = static_cast<unsigned char>(suffix.front());
    return std::isdigit(first) || suffix.front() == 'p';
}

DeviceService::DeviceService(std::string mounts_file) : mounts_file_(std::move(mounts_file)) {}

auto DeviceService::mounts_for(const std::string& device_path) const
    -> std::expected<std::vector<MountEntry>, util::Error> {
    MountTable mtab{::setmntent(mounts_file_.c_str(), "r")};
    if (!mtab) {
        return std::unexpected(util::Error::from_errno("Cannot read " + mounts_file_));
    }

    std::vector<MountEntry> result;
    while (auto* entry = ::getmntent(mtab.get())) {
        if (mount_belongs_to(entry->mnt_fsname, device_path)) {
            result.push_back(MountEntry{.device = entry->mnt_fsname,
                                        .mount_point = entry->mnt_dir,
                                        .filesystem = entry->mnt_type});
        }
    }
    return result;
}

auto DeviceService::is_mounted(const std::string& device_path) const -> bool {
    auto mounts = mounts_for(device_path);
    return mounts && !mounts->empty();
}

auto DeviceService::unmount_device(const std::string& device_path)
    -> std::expected<void, util::Error> {
    auto mounts = mounts_for(device_path);
    if (!mounts) {
        return std::unexpected(mounts.error());
    }

    int last_errno = 0;
    for (const auto& mount : *mounts) {
        LOG_INFO("DeviceService",
                 std::format("Unmounting {} from {}", mount.device, mount.mount_point));
        if (::umount2(mount.mount_point.c_str(), MNT_DETACH) != 0 &&
            ::umount2(mount.mount_point.c_str(), MNT_FORCE) != 0) {
            last_errno = errno;
            LOG_WARNING("DeviceService", std::format("umount {} failed: {}", mount.mount_point,
                                                     std::strerror(last_errno)));
        }
    }

    // Re-read the table: a lazy unmount can succeed while the entry lingers
    auto remaining = mounts_for(device_path);
    if (!remaining) {
        return std::unexpected(remaining.error());
    }
    if (!remaining->empty()) {
        const auto& still = remaining->front();
        const std::string reason = last_errno ? std::strerror(last_errno) : "Device busy";
        return std::unexpected(util::Error{
            std::format("Failed to unmount {}: {}", still.mount_point, reason), last_errno});
    }
    return {};
}
