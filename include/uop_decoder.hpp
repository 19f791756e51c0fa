// include/uop_decoder.hpp
#pragma once
#include <cstdint>
#include <map>
#include <string>

// Field view of a 48-bit uop word (bits 46..47 are CRC).
struct UopFields {
    uint16_t opcode;    // bits 32..43
    uint8_t  src0;      // bits 0..5
    uint8_t  src1;      // bits 6..11
    uint8_t  dst;       // bits 12..17
    bool     src1_imm;  // bit 9
    uint16_t imm;       // valid when src1_imm

    static UopFields extract(uint64_t word);
};

struct OpcodeInfo {
    std::string mnemonic;
    bool        jump{false};   // immediate is a uop address
};

class OpcodeTable {
public:
    void set(uint16_t opcode, OpcodeInfo info) { ops_[opcode] = std::move(info); }
    const OpcodeInfo* find(uint16_t opcode) const;
    size_t size() const { return ops_.size(); }

private:
    std::map<uint16_t, OpcodeInfo> ops_;
};

// CSV records "opcode,mnemonic[,jump]", opcode in hex.
OpcodeTable load_opcode_table(const std::string& path);

// True if the CRC bits match the parity of the 46 payload bits.
bool uop_crc_ok(uint64_t word);

// Mnemonic text for a uop. Deterministic and total: opcodes missing from
// the table print as "UOP_xxx".
std::string decode_uop(uint64_t word, uint32_t addr, const OpcodeTable& table);

// Binds a table so the decoder matches the (word, address) decode contract.
class UopDecoder {
public:
    explicit UopDecoder(OpcodeTable table) : table_(std::move(table)) {}

    std::string operator()(uint64_t word, uint32_t addr) const {
        return decode_uop(word, addr, table_);
    }

    const OpcodeTable& table() const { return table_; }

private:
    OpcodeTable table_;
};
