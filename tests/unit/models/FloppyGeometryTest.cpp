/**
 * @file FloppyGeometryTest.cpp
 * @brief Unit tests for floppy sizes and error classification
 */

#include <gtest/gtest.h>

#include "models/FloppyGeometry.hpp"
#include "models/TransferTypes.hpp"

// Test: known media sizes
TEST(FloppyGeometryTest, IsStandardSize_KnownFormats_ReturnsTrue) {
    EXPECT_TRUE(floppy::is_standard_size(737280));
    EXPECT_TRUE(floppy::is_standard_size(1474560));
    EXPECT_TRUE(floppy::is_standard_size(2949120));
    EXPECT_TRUE(floppy::is_standard_size(901120));
    EXPECT_TRUE(floppy::is_standard_size(1802240));
}

TEST(FloppyGeometryTest, IsStandardSize_OtherSizes_ReturnsFalse) {
    EXPECT_FALSE(floppy::is_standard_size(0));
    EXPECT_FALSE(floppy::is_standard_size(1474561));
    EXPECT_FALSE(floppy::is_standard_size(1000));
}

TEST(FloppyGeometryTest, IsAmigaSize_OnlyAmigaFormats) {
    EXPECT_TRUE(floppy::is_amiga_size(floppy::AMIGA_DD));
    EXPECT_TRUE(floppy::is_amiga_size(floppy::AMIGA_HD));
    EXPECT_FALSE(floppy::is_amiga_size(floppy::PC_1440K));
}

// Test: names are matched case-insensitively
TEST(FloppyGeometryTest, SizeFromName_CaseInsensitive) {
    EXPECT_EQ(floppy::size_from_name("1440K"), floppy::PC_1440K);
    EXPECT_EQ(floppy::size_from_name("720k"), floppy::PC_720K);
    EXPECT_EQ(floppy::size_from_name("1760k"), floppy::AMIGA_HD);
    EXPECT_FALSE(floppy::size_from_name("360K").has_value());
    EXPECT_FALSE(floppy::size_from_name("").has_value());
}

// Test: every standard size is a whole number of sectors
TEST(FloppyGeometryTest, StandardSizes_AreSectorMultiples) {
    for (const auto& entry : floppy::STANDARD_SIZES) {
        EXPECT_EQ(entry.bytes % floppy::SECTOR_BYTES, 0u) << entry.name;
    }
}

// Test: error kinds map to the categories front ends present
TEST(FloppyGeometryTest, ErrorCategory_GroupsKinds) {
    EXPECT_EQ(error_category(ErrorKind::CAPACITY_MISMATCH), ErrorCategory::VALIDATION);
    EXPECT_EQ(error_category(ErrorKind::INVALID_ARGUMENT), ErrorCategory::VALIDATION);
    EXPECT_EQ(error_category(ErrorKind::SHORT_SOURCE), ErrorCategory::SOURCE);
    EXPECT_EQ(error_category(ErrorKind::WRITE_ERROR), ErrorCategory::DEVICE);
    EXPECT_EQ(error_category(ErrorKind::DEVICE_BUSY), ErrorCategory::DEVICE);
    EXPECT_EQ(error_category(ErrorKind::VERIFY_MISMATCH), ErrorCategory::VERIFICATION);
}

TEST(FloppyGeometryTest, ToString_StateAndKindNames) {
    EXPECT_EQ(to_string(ErrorKind::DEVICE_BUSY), "DeviceBusy");
    EXPECT_EQ(to_string(JobState::CANCELLED), "cancelled");
    EXPECT_EQ(to_string(TransferMode::ZERO_FILL), "zero-fill");
    EXPECT_TRUE(is_terminal(JobState::FAILED));
    EXPECT_FALSE(is_terminal(JobState::RUNNING));
}
