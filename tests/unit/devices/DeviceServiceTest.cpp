/**
 * @file DeviceServiceTest.cpp
 * @brief Unit tests for DeviceService against a fake mount table
 */

#include <gtest/gtest.h>

#include "devices/DeviceService.hpp"
#include "fixtures/TestFixtures.hpp"

class DeviceServiceTest : public ::testing::Test {
protected:
    TempDirectory temp;
    std::unique_ptr<DeviceService> service;

    void SetUp() override {
        auto mounts = temp.WriteText("mounts",
                                     "/dev/sda2 / ext4 rw,relatime 0 0\n"
                                     "/dev/sdb1 /media/usb vfat rw,nosuid 0 0\n"
                                     "/dev/sdba1 /mnt/other ext4 rw 0 0\n"
                                     "/dev/fd0 /media/floppy msdos rw 0 0\n"
                                     "/dev/mmcblk0p1 /media/card vfat rw 0 0\n");
        service = std::make_unique<DeviceService>(mounts.string());
    }
};

// Test: partitions are attributed to their disk
TEST_F(DeviceServiceTest, MountsFor_Disk_ReturnsOnlyItsPartitions) {
    auto mounts = service->mounts_for("/dev/sdb");

    ASSERT_TRUE(mounts.has_value());
    ASSERT_EQ(mounts->size(), 1u);
    EXPECT_EQ(mounts->front(), (MountEntry{"/dev/sdb1", "/media/usb", "vfat"}));
}

TEST_F(DeviceServiceTest, MountsFor_WholeDeviceMount_IsFound) {
    auto mounts = service->mounts_for("/dev/fd0");

    ASSERT_TRUE(mounts.has_value());
    ASSERT_EQ(mounts->size(), 1u);
    EXPECT_EQ(mounts->front().mount_point, "/media/floppy");
    EXPECT_EQ(mounts->front().filesystem, "msdos");
}

TEST_F(DeviceServiceTest, IsMounted_ReflectsTable) {
    EXPECT_TRUE(service->is_mounted("/dev/mmcblk0"));
    EXPECT_FALSE(service->is_mounted("/dev/fd1"));
    EXPECT_FALSE(service->is_mounted("/dev/sdc"));
}

// Test: nothing to unmount succeeds without touching the system
TEST_F(DeviceServiceTest, UnmountDevice_NotMounted_Succeeds) {
    EXPECT_TRUE(service->unmount_device("/dev/fd1").has_value());
}

// Test: unreadable mount table is reported
TEST_F(DeviceServiceTest, MountsFor_MissingTable_ReturnsError) {
    DeviceService broken((temp.path() / "no-such-mounts").string());

    auto mounts = broken.mounts_for("/dev/fd0");

    ASSERT_FALSE(mounts.has_value());
    EXPECT_FALSE(broken.is_mounted("/dev/fd0"));
    EXPECT_FALSE(broken.unmount_device("/dev/fd0").has_value());
}

// Test: partition suffix rules
TEST(MountBelongsToTest, PartitionNaming) {
    EXPECT_TRUE(mount_belongs_to("/dev/sdb", "/dev/sdb"));
    EXPECT_TRUE(mount_belongs_to("/dev/sdb1", "/dev/sdb"));
    EXPECT_TRUE(mount_belongs_to("/dev/mmcblk0p2", "/dev/mmcblk0"));
    EXPECT_FALSE(mount_belongs_to("/dev/sdba", "/dev/sdb"));
    EXPECT_FALSE(mount_belongs_to("/dev/sdba1", "/dev/sdb"));
    EXPECT_FALSE(mount_belongs_to("/dev/sda", "/dev/sdb"));
    EXPECT_FALSE(mount_belongs_to("tmpfs", "/dev/fd0"));
}
