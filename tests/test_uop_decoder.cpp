#include <gtest/gtest.h>
#include "errors.hpp"
#include "test_util.hpp"
#include "uop_decoder.hpp"

static OpcodeTable sample_table() {
    OpcodeTable t;
    t.set(0x04f, OpcodeInfo{"ADD_DSZ32", false});
    t.set(0x15f, OpcodeInfo{"UJMP", true});
    return t;
}

TEST(UopDecoder, ZeroIsNop) {
    OpcodeTable t;
    EXPECT_EQ(decode_uop(0, 0, t), "NOP");
    // CRC bits alone do not make an instruction
    EXPECT_EQ(decode_uop(uint64_t(3) << 46, 0, t), "NOP");
}

TEST(UopDecoder, UnknownOpcodeGetsPlaceholder) {
    OpcodeTable t;
    EXPECT_EQ(decode_uop(encode_opcode(0xabc), 0x10, t), "UOP_abc");
}

TEST(UopDecoder, RegisterOperands) {
    uint64_t w = encode_opcode(0x04f) | (uint64_t(0x30) << 12) | 0x21 | (uint64_t(0x22) << 6);
    // src1 = 0x22 has bit 9 (src1 bit 3) clear
    EXPECT_EQ(decode_uop(w, 0, sample_table()), "ADD_DSZ32 r30, r21, r22");
}

TEST(UopDecoder, ImmediateOperand) {
    uint64_t w = encode_opcode(0x04f) | (uint64_t(0x30) << 12) | 0x21 | encode_imm(0xbeef);
    UopFields f = UopFields::extract(w);
    EXPECT_TRUE(f.src1_imm);
    EXPECT_EQ(f.imm, 0xbeef);
    EXPECT_EQ(decode_uop(w, 0, sample_table()), "ADD_DSZ32 r30, r21, 0xbeef");
}

TEST(UopDecoder, JumpTargetPrintsAsAddress) {
    uint64_t w = encode_opcode(0x15f) | encode_imm(0x7c00);
    EXPECT_EQ(decode_uop(w, 0x200, sample_table()), "UJMP U7c00");
}

TEST(UopDecoder, BoundDecoderMatchesFreeFunction) {
    UopDecoder d(sample_table());
    uint64_t w = encode_opcode(0x04f) | 0x05;
    EXPECT_EQ(d(w, 4), decode_uop(w, 4, sample_table()));
    EXPECT_EQ(d(w, 4), d(w, 4));
    EXPECT_EQ(d.table().size(), 2u);
}

TEST(UopDecoder, Crc) {
    uint64_t payload = encode_opcode(0x04f) | 0x1234;
    uint64_t word = payload | (even_odd_parity(payload) << 46);
    EXPECT_TRUE(uop_crc_ok(word));
    EXPECT_FALSE(uop_crc_ok(word ^ (uint64_t(1) << 47)));
}

TEST(OpcodeTable, Load) {
    TempDir dir;
    auto path = dir.write("opcodes.csv",
        "# opcode,mnemonic,flags\n"
        "04f,ADD_DSZ32\n"
        "0x15f, UJMP, jump\n");
    OpcodeTable t = load_opcode_table(path);
    ASSERT_NE(t.find(0x04f), nullptr);
    EXPECT_EQ(t.find(0x04f)->mnemonic, "ADD_DSZ32");
    EXPECT_FALSE(t.find(0x04f)->jump);
    EXPECT_TRUE(t.find(0x15f)->jump);
    EXPECT_EQ(t.find(0x000), nullptr);
}

TEST(OpcodeTable, RejectsMalformed) {
    TempDir dir;
    EXPECT_THROW(load_opcode_table((dir.path() / "none.csv").string()), DataLoadError);
    EXPECT_THROW(load_opcode_table(dir.write("a.csv", "04f\n")), DataLoadError);
    EXPECT_THROW(load_opcode_table(dir.write("b.csv", "1000,BIG\n")), DataLoadError);
    EXPECT_THROW(load_opcode_table(dir.write("c.csv", "04f,\n")), DataLoadError);
    EXPECT_THROW(load_opcode_table(dir.write("d.csv", "04f,ADD,fast\n")), DataLoadError);
    EXPECT_THROW(load_opcode_table(dir.write("e.csv", "04f,ADD,\xC9\xA0\n")), DataLoadError);
}
