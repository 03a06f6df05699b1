/**
 * @file DeviceLockRegistry.hpp
 * @brief Per-device exclusive locks held by running jobs
 */

#pragma once

#include "models/TransferTypes.hpp"

#include <expected>
#include <mutex>
#include <string>
#include <unordered_set>

/**
 * @class DeviceLockRegistry
 * @brief Grants at most one lease per device path
 *
 * Paths are normalized first, so "/dev/fd0" and "/dev/./fd0" name the same
 * lock. Acquisition never waits: a held device is reported as DEVICE_BUSY
 * immediately. The registry must outlive every lease it hands out.
 */
class DeviceLockRegistry {
public:
    /**
     * @class Lease
     * @brief RAII ownership of one device lock
     */
    class Lease {
    public:
        Lease() = default;
        ~Lease() { release(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        /// Give the lock back early; safe to call more than once
        void release() noexcept;

        [[nodiscard]] auto is_held() const noexcept -> bool { return registry_ != nullptr; }
        [[nodiscard]] auto key() const noexcept -> const std::string& { return key_; }

    private:
        friend class DeviceLockRegistry;
        Lease(DeviceLockRegistry* registry, std::string key)
            : registry_(registry), key_(std::move(key)) {}

        DeviceLockRegistry* registry_ = nullptr;
        std::string key_;
    };

    DeviceLockRegistry() = default;
    DeviceLockRegistry(const DeviceLockRegistry&) = delete;
    DeviceLockRegistry& operator=(const DeviceLockRegistry&) = delete;

    /**
     * @brief Lock a device without blocking
     * @param device_path Target path
     * @return Lease, or DEVICE_BUSY if another job holds the device
     */
    [[nodiscard]] auto try_acquire(const std::string& device_path)
        -> std::expected<Lease, TransferError>;

    [[nodiscard]] auto is_locked(const std::string& device_path) const -> bool;

    [[nodiscard]] auto locked_count() const -> size_t;

    /// Normalized form used as the lock key
    [[nodiscard]] static auto normalize(const std::string& device_path) -> std::string;

private:
    void release(const std::string& key) noexcept;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> held_;
};
