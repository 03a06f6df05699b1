#include "devices/DeviceLockRegistry.hpp"

#include "util/Logger.hpp"

#include <filesystem>
#include <format>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

DeviceLockRegistry::Lease::Lease(Lease&& other) noexcept
    : registry_(std::exchange(other.registry_, nullptr)), key_(std::move(other.key_)) {}

DeviceLockRegistry::Lease& DeviceLockRegistry::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = std::exchange(other.registry_, nullptr);
        key_ = std::move(other.key_);
    }
    return *this;
}

void DeviceLockRegistry::Lease::release() noexcept {
    if (auto* registry = std::exchange(registry_, nullptr)) {
        registry->release(key_);
    }
}

auto DeviceLockRegistry::normalize(const std::string& device_path) -> std::string {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(device_path, ec);
    if (ec) {
        return fs::path(device_path).lexically_normal().string();
    }
    return canonical.string();
}

auto DeviceLockRegistry::try_acquire(const std::string& device_path)
    -> std::expected<Lease, TransferError> {
    auto key = normalize(device_path);

    std::lock_guard lock(mutex_);
    if (!held_.insert(key).second) {
        LOG_WARNING("DeviceLockRegistry", std::format("{} is already in use by another job", key));
        return std::unexpected(TransferError{
            .kind = ErrorKind::DEVICE_BUSY,
            .message = std::format("{} is in use by another job", device_path)});
    }
    return Lease{this, std::move(key)};
}

auto DeviceLockRegistry::is_locked(const std::string& device_path) const -> bool {
    const auto key = normalize(device_path);
    std::lock_guard lock(mutex_);
    return held_.contains(key);
}

auto DeviceLockRegistry::locked_count() const -> size_t {
    std::lock_guard lock(mutex_);
    return held_.size();
}

void DeviceLockRegistry::release(const std::string& key) noexcept {
    std::lock_guard lock(mutex_);
    held_.erase(key);
}
