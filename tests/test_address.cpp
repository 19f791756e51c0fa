#include <gtest/gtest.h>
#include "address.hpp"
#include "errors.hpp"
#include "util.hpp"

TEST(Address, QuadBaseAndSlot) {
    EXPECT_EQ(quad_base(0), 0u);
    EXPECT_EQ(quad_base(3), 0u);
    EXPECT_EQ(quad_base(4), 4u);
    EXPECT_EQ(quad_base(0x7BFE), 0x7BFCu);
    EXPECT_EQ(quad_slot(0x7BFF), 3u);
    EXPECT_EQ(quad_index(0x7BFF), QUAD_COUNT - 1);
}

TEST(Address, SlotThreeIsNotAUop) {
    for (uint32_t a = 0; a < 16; ++a)
        EXPECT_EQ(is_uop_slot(a), a % 4 != 3) << a;
}

TEST(Address, CheckRejectsOutOfRange) {
    EXPECT_NO_THROW(check_uaddr(0x7BFF, "test"));
    EXPECT_THROW(check_uaddr(0x7C00, "test"), InvariantViolation);
    EXPECT_THROW(check_uaddr(0xFFFFFFFF, "test"), InvariantViolation);
}

TEST(Address, Format) {
    EXPECT_EQ(uaddr_str(0), "U0000");
    EXPECT_EQ(uaddr_str(0x7c00), "U7c00");
    EXPECT_EQ(hex_str(0xABCDEF, 12), "000000abcdef");
}

TEST(Util, ParseHex) {
    uint64_t v = 0;
    EXPECT_TRUE(parse_hex_u64("0x1F", v));
    EXPECT_EQ(v, 0x1Fu);
    EXPECT_TRUE(parse_hex_u64("dead_beef", v));
    EXPECT_EQ(v, 0xdeadbeefu);
    EXPECT_TRUE(parse_hex_u64("FFFFFFFFFFFFFFFF", v));
    EXPECT_EQ(v, ~uint64_t(0));

    EXPECT_FALSE(parse_hex_u64("", v));
    EXPECT_FALSE(parse_hex_u64("0x", v));
    EXPECT_FALSE(parse_hex_u64("12g4", v));
    EXPECT_FALSE(parse_hex_u64("-1", v));
    EXPECT_FALSE(parse_hex_u64("10000000000000000", v));
}

TEST(Util, Trim) {
    EXPECT_EQ(trim("  a b \t\r\n"), "a b");
    EXPECT_EQ(trim(" \t "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(Util, EvenOddParity) {
    EXPECT_EQ(even_odd_parity(0), 0u);
    EXPECT_EQ(even_odd_parity(0b01), 1u);
    EXPECT_EQ(even_odd_parity(0b10), 2u);
    EXPECT_EQ(even_odd_parity(0b0101), 0u);
    EXPECT_EQ(even_odd_parity(0b0110), 3u);
}
