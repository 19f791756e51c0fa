#include <gtest/gtest.h>
#include <stdexcept>
#include "errors.hpp"
#include "test_util.hpp"
#include "ucode_store.hpp"

static std::vector<uint64_t> ramp() {
    std::vector<uint64_t> v(UADDR_LIMIT);
    for (uint32_t i = 0; i < UADDR_LIMIT; ++i) v[i] = 0x100000000000ull + i;
    return v;
}

TEST(WordStore, RequiresFullAddressSpace) {
    EXPECT_THROW({ WordStore bad{std::vector<uint64_t>(8)}; }, std::invalid_argument);
    WordStore ws(ramp());
    EXPECT_EQ(ws.at(0x7BFF), 0x100000000000ull + 0x7BFF);
    EXPECT_THROW(ws.at(UADDR_LIMIT), InvariantViolation);
}

TEST(GroupControlStore, EveryAddressResolvesToItsQuadBase) {
    auto linear = ramp();
    GroupControlStore gs(linear);
    for (uint32_t a = 0; a < UADDR_LIMIT; ++a)
        ASSERT_EQ(gs.at(a), gs.at(quad_base(a))) << uaddr_str(a);
    EXPECT_EQ(gs.at(0x0006), linear[4]);
    EXPECT_EQ(gs.quad(1), linear[4]);
    EXPECT_THROW(gs.quad(QUAD_COUNT), InvariantViolation);
    EXPECT_THROW(gs.at(UADDR_LIMIT), InvariantViolation);
}

TEST(GroupControlStore, CountsDisagreeingAliases) {
    std::vector<uint64_t> linear(UADDR_LIMIT, 0);
    linear[4] = linear[5] = linear[6] = linear[7] = 0x42;
    EXPECT_EQ(GroupControlStore(linear).aliased_mismatches(), 0u);

    linear[6] = 0x43;
    linear[9] = 0x1;
    GroupControlStore gs(linear);
    EXPECT_EQ(gs.aliased_mismatches(), 2u);
    EXPECT_EQ(gs.at(6), 0x42u);
    EXPECT_EQ(gs.at(9), 0u);
}

TEST(MsArray, ReadsAddressedLines) {
    TempDir dir;
    auto words = ramp();
    auto path = dir.write("ms_array0.txt", "# uops\n" + ms_array_text(words));
    EXPECT_EQ(read_ms_array(path), words);
}

TEST(MsArray, AcceptsBareValuesAndComments) {
    TempDir dir;
    auto path = dir.write("small.txt",
        "0x1 2 ; first two\n"
        "\n"
        "0003_0000 // third\n"
        "ffffffffffff\n");
    auto v = read_ms_array(path, 4);
    ASSERT_EQ(v.size(), 4u);
    EXPECT_EQ(v[2], 0x30000u);
    EXPECT_EQ(v[3], 0xFFFFFFFFFFFFull);
}

TEST(MsArray, RejectsBadInput) {
    TempDir dir;
    EXPECT_THROW(read_ms_array((dir.path() / "missing.txt").string(), 4), DataLoadError);
    EXPECT_THROW(read_ms_array(dir.write("a.txt", "1 2 3\n"), 4), DataLoadError);          // truncated
    EXPECT_THROW(read_ms_array(dir.write("c.txt", "1 2 zz 4\n"), 4), DataLoadError);       // not hex
    EXPECT_THROW(read_ms_array(dir.write("d.txt", "1 2 3 1000000000000\n"), 4), DataLoadError); // 49 bits
    EXPECT_THROW(read_ms_array(dir.write("e.txt", "0000: 1 2\n0003: 3 4\n"), 4), DataLoadError); // order
}

TEST(MsArray, IgnoresWordsPastTheEnd) {
    TempDir dir;
    auto v = read_ms_array(dir.write("long.txt", "0000: 1 2 3 4\n0004: 5 6\n"), 4);
    ASSERT_EQ(v.size(), 4u);
    EXPECT_EQ(v[3], 4u);
    // trailing addressed lines still have to be in order
    EXPECT_THROW(read_ms_array(dir.write("bad.txt", "0000: 1 2 3 4\n0008: 5\n"), 4), DataLoadError);
}

TEST(MsArray, ErrorNamesTheFile) {
    TempDir dir;
    auto path = dir.write("bad.txt", "1 x\n");
    try {
        read_ms_array(path, 2);
        FAIL() << "expected DataLoadError";
    } catch (const DataLoadError& e) {
        EXPECT_EQ(e.source(), path);
        EXPECT_NE(std::string(e.what()).find("line 1"), std::string::npos);
    }
}

TEST(UcodeDump, LoadsBothArraysForCpuid) {
    TempDir dir;
    auto words = ramp();
    std::vector<uint64_t> seqw(UADDR_LIMIT, 0);
    for (uint32_t a = 0; a < UADDR_LIMIT; ++a) seqw[a] = quad_index(a);
    dir.write("0x000506CA/ms_array0.txt", ms_array_text(words));
    dir.write("0x000506CA/ms_array1.txt", ms_array_text(seqw));

    UcodeDump d = load_ucode_dump(dir.path().string(), "0x000506CA");
    EXPECT_EQ(d.cpuid, "0x000506CA");
    EXPECT_EQ(d.words.at(0x1234), words[0x1234]);
    EXPECT_EQ(d.seqwords.at(0x1237), quad_index(0x1234));

    Triad t = d.triad(0x0106);
    EXPECT_EQ(t.instructions[0], words[0x104]);
    EXPECT_EQ(t.instructions[2], words[0x106]);
    EXPECT_EQ(t.sequence_word, 0x41u);
}

TEST(UcodeDump, FailsWholeLoadIfOneArrayIsBad) {
    TempDir dir;
    dir.write("cpu/ms_array0.txt", ms_array_text(ramp()));
    dir.write("cpu/ms_array1.txt", "0000: 1 2 3\n");
    EXPECT_THROW(load_ucode_dump(dir.path().string(), "cpu"), DataLoadError);
    EXPECT_THROW(load_ucode_dump(dir.path().string(), "other"), DataLoadError);
}
