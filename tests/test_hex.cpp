#include <gtest/gtest.h>

#include "util/hex.hpp"

#include <vector>

TEST(HexTest, EncodesLowerCase) {
    const std::vector<std::uint8_t> bytes{0x00, 0x7f, 0xab, 0xff};
    EXPECT_EQ(stash::HexEncode(bytes), "007fabff");
    EXPECT_EQ(stash::HexEncode({}), "");
}

TEST(HexTest, DecodesEitherCase) {
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(stash::HexDecode("007FabFF", out));
    EXPECT_EQ(out, (std::vector<std::uint8_t>{0x00, 0x7f, 0xab, 0xff}));
}

TEST(HexTest, RejectsMalformedInput) {
    std::vector<std::uint8_t> out{1};
    EXPECT_FALSE(stash::HexDecode("abc", out));
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(stash::HexDecode("zz", out));
    EXPECT_FALSE(stash::HexDecode("0x00", out));
}
