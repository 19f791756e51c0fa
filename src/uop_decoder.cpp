#include "uop_decoder.hpp"
#include "address.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

static constexpr uint64_t UOP_PAYLOAD_MASK = 0x3FFFFFFFFFFF; // below the CRC

UopFields UopFields::extract(uint64_t word) {
    const uint64_t w = word & UOP_PAYLOAD_MASK;
    UopFields f;
    f.opcode   = static_cast<uint16_t>((w >> 32) & 0xFFF);
    f.src0     = static_cast<uint8_t>(w & 0x3F);
    f.src1     = static_cast<uint8_t>((w >> 6) & 0x3F);
    f.dst      = static_cast<uint8_t>((w >> 12) & 0x3F);
    f.src1_imm = ((w >> 9) & 1) != 0;
    // imm[7:0] @ 24..31, imm[12:8] @ 18..22, imm[15:13] @ 6..8
    f.imm = static_cast<uint16_t>(((w >> 24) & 0xFF) | ((w >> 10) & 0x1F00) | ((w << 7) & 0xE000));
    return f;
}

const OpcodeInfo* OpcodeTable::find(uint16_t opcode) const {
    auto it = ops_.find(opcode);
    return it == ops_.end() ? nullptr : &it->second;
}

bool uop_crc_ok(uint64_t word) {
    return ((word >> 46) & 0x3) == even_odd_parity(word & UOP_PAYLOAD_MASK);
}

static std::string reg_str(uint8_t sel) { return "r" + hex_str(sel, 2); }

std::string decode_uop(uint64_t word, uint32_t /*addr*/, const OpcodeTable& table) {
    if ((word & UOP_PAYLOAD_MASK) == 0) return "NOP";

    const UopFields f = UopFields::extract(word);
    const OpcodeInfo* info = table.find(f.opcode);

    std::string text = info ? info->mnemonic : "UOP_" + hex_str(f.opcode, 3);

    // selector 0 means "no operand"
    std::vector<std::string> ops;
    if (f.dst)  ops.push_back(reg_str(f.dst));
    if (f.src0) ops.push_back(reg_str(f.src0));
    if (f.src1_imm) {
        if (info && info->jump) ops.push_back(uaddr_str(f.imm));
        else                    ops.push_back("0x" + hex_str(f.imm, 4));
    } else if (f.src1) {
        ops.push_back(reg_str(f.src1));
    }

    for (size_t i = 0; i < ops.size(); ++i)
        text += (i == 0 ? " " : ", ") + ops[i];
    return text;
}

OpcodeTable load_opcode_table(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw DataLoadError(path, "cannot open");

    OpcodeTable table;
    std::string line;
    size_t lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto where = [&]() { return "line " + std::to_string(lineno); };

        std::vector<std::string> cols;
        std::istringstream iss(line);
        std::string col;
        while (std::getline(iss, col, ',')) cols.push_back(trim(col));

        if (cols.size() < 2 || cols.size() > 3)
            throw DataLoadError(path, "expected 'opcode,mnemonic[,jump]' at " + where());

        uint64_t opcode = 0;
        if (!parse_hex_u64(cols[0], opcode) || opcode > 0xFFF)
            throw DataLoadError(path, "bad opcode '" + cols[0] + "' at " + where());
        if (cols[1].empty())
            throw DataLoadError(path, "empty mnemonic at " + where());

        OpcodeInfo info;
        info.mnemonic = cols[1];
        if (cols.size() == 3) {
            std::string flag = cols[2];
            std::transform(flag.begin(), flag.end(), flag.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (flag == "jump")      info.jump = true;
            else if (!flag.empty())
                throw DataLoadError(path, "unknown flag '" + cols[2] + "' at " + where());
        }
        table.set(static_cast<uint16_t>(opcode), std::move(info));
    }
    if (f.bad()) throw DataLoadError(path, "read error");
    return table;
}
