/**
 * @file ZeroFillSourceTest.cpp
 * @brief Unit tests for ZeroFillSource
 */

#include <gtest/gtest.h>

#include "sources/ZeroFillSource.hpp"
#include "fixtures/TestFixtures.hpp"

// Test: produces exactly size() zero bytes
TEST(ZeroFillSourceTest, Read_ProducesZerosUpToSize) {
    ZeroFillSource source(3000);
    ASSERT_TRUE(source.open().has_value());

    std::vector<uint8_t> buffer(2048, 0xFF);
    auto first = source.read(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 2048u);
    EXPECT_TRUE(IsAllBytes(buffer, 0, 2048, 0x00));

    std::fill(buffer.begin(), buffer.end(), 0xFF);
    auto second = source.read(buffer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, 952u);
    EXPECT_TRUE(IsAllBytes(buffer, 0, 952, 0x00));
    EXPECT_TRUE(IsAllBytes(buffer, 952, 2048, 0xFF));

    auto end = source.read(buffer);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, 0u);
    EXPECT_EQ(source.remaining(), 0u);
}

// Test: reopening rewinds
TEST(ZeroFillSourceTest, Open_AfterExhausted_Rewinds) {
    ZeroFillSource source(512);
    std::vector<uint8_t> buffer(512);
    ASSERT_TRUE(source.open().has_value());
    ASSERT_TRUE(source.read(buffer).has_value());
    EXPECT_EQ(source.remaining(), 0u);

    ASSERT_TRUE(source.open().has_value());

    EXPECT_EQ(source.remaining(), 512u);
    EXPECT_EQ(source.size(), 512u);
}

TEST(ZeroFillSourceTest, Describe_MentionsSize) {
    ZeroFillSource source(1474560);
    EXPECT_EQ(source.describe(), "zero fill of 1.41 MB");
}
