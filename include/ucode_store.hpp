// include/ucode_store.hpp
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "address.hpp"

static constexpr uint64_t WORD_MASK = (uint64_t(1) << 48) - 1;

// One 48-bit uop word per MSROM address.
class WordStore {
public:
    WordStore() : words_(UADDR_LIMIT, 0) {}
    // Throws std::invalid_argument unless words.size() == UADDR_LIMIT.
    explicit WordStore(std::vector<uint64_t> words);

    uint64_t at(uint32_t addr) const;
    size_t   size() const { return words_.size(); }

private:
    std::vector<uint64_t> words_;
};

// Sequence words. Only quad bases carry data; every address of a quad
// resolves to the entry of its base, so storage is one slot per quad.
class GroupControlStore {
public:
    GroupControlStore() : quads_(QUAD_COUNT, 0) {}
    // Takes a per-address array (UADDR_LIMIT entries) as dumped from the
    // hardware and keeps the quad base values.
    explicit GroupControlStore(const std::vector<uint64_t>& linear);

    uint64_t at(uint32_t addr) const;
    uint64_t quad(uint32_t index) const;

    // Non-base entries of the input that disagreed with their base.
    size_t aliased_mismatches() const { return mismatches_; }

private:
    std::vector<uint64_t> quads_;
    size_t mismatches_{0};
};

// Three uops and the sequence word governing them, as a patch entry lays
// them out.
struct Triad {
    std::array<uint64_t, 3> instructions;
    uint64_t sequence_word;
};

struct UcodeDump {
    std::string       cpuid;
    WordStore         words;
    GroupControlStore seqwords;

    Triad triad(uint32_t addr) const;
};

// Reads a text dump of exactly `expected` 48-bit words.
// Lines: [ADDR:] word word ... ; comments '#', ';', '//'.
std::vector<uint64_t> read_ms_array(const std::string& path, size_t expected = UADDR_LIMIT);

// <data_dir>/<cpuid>/ms_array0.txt and ms_array1.txt
UcodeDump load_ucode_dump(const std::string& data_dir, const std::string& cpuid);
