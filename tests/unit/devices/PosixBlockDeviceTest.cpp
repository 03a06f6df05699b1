/**
 * @file PosixBlockDeviceTest.cpp
 * @brief Unit tests for PosixBlockDevice using regular files as targets
 */

#include <gtest/gtest.h>

#include "devices/PosixBlockDevice.hpp"
#include "fixtures/TestFixtures.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <type_traits>

class PosixBlockDeviceTest : public ::testing::Test {
protected:
    TempDirectory temp;
    std::string target;

    void SetUp() override {
        target = temp.WriteFile("target.img", std::vector<uint8_t>(4096, 0xAA)).string();
    }

    std::unique_ptr<PosixBlockDevice> OpenTarget() {
        auto device = PosixBlockDevice::open(target, {.allow_regular_files = true});
        EXPECT_TRUE(device.has_value());
        return device ? std::move(*device) : nullptr;
    }
};

// Test: regular files are refused unless allowed
TEST_F(PosixBlockDeviceTest, Open_RegularFileNotAllowed_FailsWithInvalidArgument) {
    auto device = PosixBlockDevice::open(target, {});

    ASSERT_FALSE(device.has_value());
    EXPECT_EQ(device.error().kind, ErrorKind::INVALID_ARGUMENT);
}

TEST_F(PosixBlockDeviceTest, Open_RegularFileAllowed_ReportsSizeAndDefaultSector) {
    auto device = OpenTarget();
    ASSERT_NE(device, nullptr);

    EXPECT_EQ(device->capacity(), 4096u);
    EXPECT_EQ(device->sector_size(), 512u);
    EXPECT_EQ(device->path(), target);
    EXPECT_FALSE(device->is_block_device());
}

TEST_F(PosixBlockDeviceTest, Open_MissingPath_FailsWithDeviceNotFound) {
    auto device = PosixBlockDevice::open((temp.path() / "missing").string(),
                                         {.allow_regular_files = true});

    ASSERT_FALSE(device.has_value());
    EXPECT_EQ(device.error().kind, ErrorKind::DEVICE_NOT_FOUND);
}

// Test: written bytes read back and persist after close
TEST_F(PosixBlockDeviceTest, WriteAt_ThenReadAt_RoundTrips) {
    auto device = OpenTarget();
    ASSERT_NE(device, nullptr);
    auto data = make_pattern(1024);

    auto written = device->write_at(512, data);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, 1024u);
    ASSERT_TRUE(device->flush().has_value());

    std::vector<uint8_t> back(1024);
    auto read = device->read_at(512, back);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, 1024u);
    EXPECT_EQ(back, data);

    std::vector<uint8_t> head(512);
    ASSERT_TRUE(device->read_at(0, head).has_value());
    EXPECT_TRUE(IsAllBytes(head, 0, 512, 0xAA));
    device->close();
}

// Test: a write past the capacity is refused with the offset
TEST_F(PosixBlockDeviceTest, WriteAt_BeyondCapacity_FailsWithWriteError) {
    auto device = OpenTarget();
    ASSERT_NE(device, nullptr);

    auto written = device->write_at(3584, make_pattern(1024));

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind, ErrorKind::WRITE_ERROR);
    EXPECT_EQ(written.error().offset, 3584u);
    EXPECT_EQ(std::filesystem::file_size(target), 4096u);
}

// Test: operations after close fail instead of crashing
TEST_F(PosixBlockDeviceTest, WriteAt_AfterClose_Fails) {
    auto device = OpenTarget();
    ASSERT_NE(device, nullptr);
    device->close();

    auto written = device->write_at(0, make_pattern(512));

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind, ErrorKind::WRITE_ERROR);
}

// Test: the opener returns the interface type
TEST_F(PosixBlockDeviceTest, Opener_BoundOptions_OpensTarget) {
    auto opener = PosixBlockDevice::opener({.allow_regular_files = true});

    auto device = opener(target, DeviceAccess::READ_WRITE);

    ASSERT_TRUE(device.has_value());
    EXPECT_EQ((*device)->capacity(), 4096u);
    EXPECT_TRUE((*device)->write_at(0, make_pattern(512)).has_value());
}

// Test: a read-only target reads back but never takes a write
TEST_F(PosixBlockDeviceTest, Open_ReadOnly_ReadsAndRefusesWrites) {
    std::filesystem::permissions(target, std::filesystem::perms::owner_read |
                                             std::filesystem::perms::group_read |
                                             std::filesystem::perms::others_read);

    auto device = PosixBlockDevice::open(
        target, {.allow_regular_files = true, .access = DeviceAccess::READ_ONLY});
    ASSERT_TRUE(device.has_value()) << device.error().message;
    EXPECT_EQ((*device)->access(), DeviceAccess::READ_ONLY);

    std::vector<uint8_t> back(512);
    auto read = (*device)->read_at(0, back);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, 512u);
    EXPECT_TRUE(IsAllBytes(back, 0, 512, 0xAA));

    auto written = (*device)->write_at(0, make_pattern(512));
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind, ErrorKind::WRITE_ERROR);
    EXPECT_EQ(written.error().offset, 0u);
    (*device)->close();

    std::vector<uint8_t> on_disk(4096);
    std::ifstream(target, std::ios::binary).read(reinterpret_cast<char*>(on_disk.data()), 4096);
    EXPECT_TRUE(IsAllBytes(on_disk, 0, 4096, 0xAA));
}

// Test: the access mode given to the opener wins over the bound options
TEST_F(PosixBlockDeviceTest, Opener_ReadOnlyAccess_OverridesBoundOptions) {
    auto opener = PosixBlockDevice::opener({.allow_regular_files = true});

    auto device = opener(target, DeviceAccess::READ_ONLY);

    ASSERT_TRUE(device.has_value());
    EXPECT_FALSE((*device)->write_at(0, make_pattern(512)).has_value());
}

// Test: devices only come out of open()
TEST_F(PosixBlockDeviceTest, Open_OnlyFactoryConstructs) {
    static_assert(!std::is_constructible_v<PosixBlockDevice, std::string, util::FileDescriptor,
                                           uint64_t, uint32_t, bool, DeviceAccess>);

    auto device = OpenTarget();
    ASSERT_NE(device, nullptr);
    EXPECT_EQ(device->access(), DeviceAccess::READ_WRITE);
}

// Test: open errors map to user-facing kinds
TEST(OpenErrnoTest, ErrorKindForOpenErrno_MapsKnownErrors) {
    EXPECT_EQ(error_kind_for_open_errno(EBUSY), ErrorKind::DEVICE_BUSY);
    EXPECT_EQ(error_kind_for_open_errno(ETXTBSY), ErrorKind::DEVICE_BUSY);
    EXPECT_EQ(error_kind_for_open_errno(EACCES), ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(error_kind_for_open_errno(EPERM), ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(error_kind_for_open_errno(EROFS), ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(error_kind_for_open_errno(ENOENT), ErrorKind::DEVICE_NOT_FOUND);
    EXPECT_EQ(error_kind_for_open_errno(ENOMEDIUM), ErrorKind::DEVICE_NOT_FOUND);
    EXPECT_EQ(error_kind_for_open_errno(ENXIO), ErrorKind::DEVICE_NOT_FOUND);
    EXPECT_EQ(error_kind_for_open_errno(EINVAL), ErrorKind::INVALID_ARGUMENT);
}
