#include <gtest/gtest.h>

#include "util/Checksum.hpp"

using namespace havc;

// Test: Known CRC-32 vectors
TEST(ChecksumTest, KnownVectors) {
    EXPECT_EQ(Checksum::of("").crc, 0u);
    EXPECT_EQ(Checksum::of("123456789").crc, 0xCBF43926u);
    EXPECT_EQ(Checksum::of("123456789").size, 9u);
}

// Test: Same CRC with different length still differs
TEST(ChecksumTest, ComparesLength) {
    Checksum a = Checksum::of("abc");
    Checksum b = a;
    b.size = 4;
    EXPECT_NE(a, b);
    EXPECT_EQ(a, Checksum::of("abc"));
    EXPECT_NE(a, Checksum::of("abd"));
}

// Test: Printable form
TEST(ChecksumTest, ToString) {
    EXPECT_EQ(Checksum::of("123456789").toString(), "crc32:cbf43926/9");
}
