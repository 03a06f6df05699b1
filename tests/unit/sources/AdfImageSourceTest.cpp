/**
 * @file AdfImageSourceTest.cpp
 * @brief Unit tests for AdfImageSource and the boot block decoder
 */

#include <gtest/gtest.h>

#include "sources/AdfImageSource.hpp"
#include "models/FloppyGeometry.hpp"
#include "fixtures/TestFixtures.hpp"

namespace {

void PutBe32(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
    data[offset] = static_cast<uint8_t>(value >> 24);
    data[offset + 1] = static_cast<uint8_t>(value >> 16);
    data[offset + 2] = static_cast<uint8_t>(value >> 8);
    data[offset + 3] = static_cast<uint8_t>(value);
}

// Formatted DD disk with an FFS boot block and a correct checksum
std::vector<uint8_t> MakeAdf(uint64_t size, uint8_t flags = 0x01) {
    std::vector<uint8_t> data(size, 0);
    data[0] = 'D';
    data[1] = 'O';
    data[2] = 'S';
    data[3] = flags;
    PutBe32(data, 8, 880);  // root block
    PutBe32(data, 12, 0x43FA0018);
    const auto checksum = AdfBootBlock::compute_checksum(
        std::span<const uint8_t, AdfBootBlock::SIZE>(data.data(), AdfBootBlock::SIZE));
    PutBe32(data, 4, checksum);
    return data;
}

}  // namespace

class AdfImageSourceTest : public ::testing::Test {
protected:
    TempDirectory temp;
};

// Test: checksum of a block holding only "DOS\0"
TEST_F(AdfImageSourceTest, ComputeChecksum_DosMagicOnly_IsComplementOfMagic) {
    std::array<uint8_t, AdfBootBlock::SIZE> block{};
    block[0] = 'D';
    block[1] = 'O';
    block[2] = 'S';

    EXPECT_EQ(AdfBootBlock::compute_checksum(block), 0xBBB0ACFFu);
}

// Test: the checksum longword itself does not take part
TEST_F(AdfImageSourceTest, ComputeChecksum_IgnoresChecksumField) {
    std::array<uint8_t, AdfBootBlock::SIZE> block{};
    block[0] = 'D';
    const auto before = AdfBootBlock::compute_checksum(block);
    block[4] = 0x12;
    block[7] = 0x34;

    EXPECT_EQ(AdfBootBlock::compute_checksum(block), before);
}

// Test: end-around carry when the sum overflows
TEST_F(AdfImageSourceTest, ComputeChecksum_Overflow_WrapsCarry) {
    std::array<uint8_t, AdfBootBlock::SIZE> block{};
    block.fill(0);
    // 0xFFFFFFFF + 0x00000002 = 0x1'00000001 -> 0x00000002 after carry
    block[8] = block[9] = block[10] = block[11] = 0xFF;
    block[15] = 0x02;

    EXPECT_EQ(AdfBootBlock::compute_checksum(block), ~uint32_t{2});
}

// Test: a valid FFS boot block decodes as bootable
TEST_F(AdfImageSourceTest, Create_ValidBootBlock_IsBootableFfs) {
    auto path = temp.WriteFile("workbench.adf", MakeAdf(floppy::AMIGA_DD));

    auto source = AdfImageSource::create(path);

    ASSERT_TRUE(source.has_value());
    const auto& boot = (*source)->boot_block();
    EXPECT_TRUE(boot.has_dos_magic);
    EXPECT_TRUE(boot.fast_file_system);
    EXPECT_TRUE(boot.is_bootable());
    EXPECT_EQ(boot.filesystem_name(), "FFS");
    EXPECT_FALSE((*source)->is_high_density());
    EXPECT_EQ((*source)->describe(), "Amiga DD image workbench.adf (FFS, bootable)");
}

// Test: a damaged checksum is not bootable
TEST_F(AdfImageSourceTest, Create_BadChecksum_IsNotBootable) {
    auto data = MakeAdf(floppy::AMIGA_HD, 0x05);
    data[20] ^= 0xFF;
    auto source = AdfImageSource::create(temp.WriteFile("data.adf", data));

    ASSERT_TRUE(source.has_value());
    const auto& boot = (*source)->boot_block();
    EXPECT_TRUE(boot.has_dos_magic);
    EXPECT_FALSE(boot.is_bootable());
    EXPECT_EQ(boot.filesystem_name(), "FFS+DirCache");
    EXPECT_TRUE((*source)->is_high_density());
}

// Test: non-DOS disks are accepted and written unchanged
TEST_F(AdfImageSourceTest, Create_NonDosDisk_AcceptedAsNonDos) {
    auto source = AdfImageSource::create(temp.WriteFile("game.adf", make_pattern(floppy::AMIGA_DD)));

    ASSERT_TRUE(source.has_value());
    EXPECT_FALSE((*source)->boot_block().has_dos_magic);
    EXPECT_EQ((*source)->boot_block().filesystem_name(), "non-DOS");
    EXPECT_EQ((*source)->size(), floppy::AMIGA_DD);
}

// Test: geometry other than Amiga DD/HD is rejected
TEST_F(AdfImageSourceTest, Create_PcSize_FailsWithInvalidArgument) {
    auto source = AdfImageSource::create(temp.WriteFile("pc.adf", make_pattern(floppy::PC_1440K)));

    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().kind, ErrorKind::INVALID_ARGUMENT);
}
