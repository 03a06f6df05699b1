/**
 * @file DeviceLockRegistryTest.cpp
 * @brief Unit tests for DeviceLockRegistry
 */

#include <gtest/gtest.h>

#include "devices/DeviceLockRegistry.hpp"
#include "fixtures/TestFixtures.hpp"

class DeviceLockRegistryTest : public ::testing::Test {
protected:
    DeviceLockRegistry registry;
};

// Test: first acquire wins, second is busy
TEST_F(DeviceLockRegistryTest, TryAcquire_HeldDevice_FailsWithDeviceBusy) {
    auto first = registry.try_acquire("/dev/fd0");
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->is_held());

    auto second = registry.try_acquire("/dev/fd0");

    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().kind, ErrorKind::DEVICE_BUSY);
    EXPECT_TRUE(registry.is_locked("/dev/fd0"));
}

// Test: different devices are independent
TEST_F(DeviceLockRegistryTest, TryAcquire_DifferentDevices_BothSucceed) {
    auto a = registry.try_acquire("/dev/fd0");
    auto b = registry.try_acquire("/dev/fd1");

    EXPECT_TRUE(a.has_value());
    EXPECT_TRUE(b.has_value());
    EXPECT_EQ(registry.locked_count(), 2u);
}

// Test: spellings of the same path share one lock
TEST_F(DeviceLockRegistryTest, TryAcquire_EquivalentSpelling_IsBusy) {
    auto first = registry.try_acquire("/dev/fd0");
    ASSERT_TRUE(first.has_value());

    auto second = registry.try_acquire("/dev/./fd0");

    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().kind, ErrorKind::DEVICE_BUSY);
}

// Test: destroying or releasing a lease frees the device
TEST_F(DeviceLockRegistryTest, Lease_DestroyedOrReleased_UnlocksDevice) {
    {
        auto lease = registry.try_acquire("/dev/fd0");
        ASSERT_TRUE(lease.has_value());
    }
    EXPECT_FALSE(registry.is_locked("/dev/fd0"));

    auto lease = registry.try_acquire("/dev/fd0");
    ASSERT_TRUE(lease.has_value());
    lease->release();
    lease->release();

    EXPECT_FALSE(lease->is_held());
    EXPECT_EQ(registry.locked_count(), 0u);
}

// Test: moving a lease transfers ownership without releasing
TEST_F(DeviceLockRegistryTest, Lease_Moved_KeepsLockUntilTargetReleases) {
    auto acquired = registry.try_acquire("/dev/fd0");
    ASSERT_TRUE(acquired.has_value());

    DeviceLockRegistry::Lease moved = std::move(*acquired);

    EXPECT_FALSE(acquired->is_held());
    EXPECT_TRUE(moved.is_held());
    EXPECT_TRUE(registry.is_locked("/dev/fd0"));

    moved = DeviceLockRegistry::Lease{};
    EXPECT_FALSE(registry.is_locked("/dev/fd0"));
}

// Test: concurrent acquisition grants exactly one lease
TEST_F(DeviceLockRegistryTest, TryAcquire_Concurrent_ExactlyOneWins) {
    constexpr int THREADS = 8;
    std::atomic<int> winners{0};
    std::vector<DeviceLockRegistry::Lease> leases(THREADS);
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([this, i, &winners, &leases] {
            if (auto lease = registry.try_acquire("/dev/sdb")) {
                leases[static_cast<size_t>(i)] = std::move(*lease);
                winners.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(winners.load(), 1);
}
