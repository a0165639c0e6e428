#include <gtest/gtest.h>
#include "test_support.h"
#include "utils/checksum.h"

TEST(ChecksumTest, Crc32CheckValue) {
    const std::string data = "123456789";
    ASSERT_EQ(crc32(reinterpret_cast<const uint8_t*>(data.data()), data.size()), 0xCBF43926u);
    ASSERT_EQ(crc32(nullptr, 0), 0u);
}

TEST(ChecksumTest, Crc32IsIncremental) {
    const std::string data = "slides and more slides";
    const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
    uint32_t whole = crc32(bytes, data.size());
    uint32_t first = crc32(bytes, 7);
    ASSERT_EQ(crc32(bytes + 7, data.size() - 7, first), whole);
}

TEST(ChecksumTest, Fnv1a64KnownValues) {
    ASSERT_EQ(fnv1a64(""), 0xcbf29ce484222325ull);
    ASSERT_EQ(fnv1a64("a"), 0xaf63dc4c8601ec8cull);
    ASSERT_NE(fnv1a64("ab"), fnv1a64("ba"));
}

TEST(ChecksumTest, HexIsFixedWidthLowercase) {
    ASSERT_EQ(toHex32(0xABCD), "0000abcd");
    ASSERT_EQ(toHex64(0x1ull), "0000000000000001");
    ASSERT_EQ(toHex64(0xcbf29ce484222325ull), "cbf29ce484222325");
}

class ChecksumFileTest : public TempDirTest {};

TEST_F(ChecksumFileTest, FileMatchesBuffer) {
    writeText(dir_ / "a.txt", "123456789");
    uint32_t crc = 0;
    ASSERT_TRUE(crc32File(dir_ / "a.txt", crc));
    ASSERT_EQ(crc, 0xCBF43926u);
    ASSERT_FALSE(crc32File(dir_ / "missing.txt", crc));
}
