#include "ucode_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

WordStore::WordStore(std::vector<uint64_t> words) : words_(std::move(words)) {
    if (words_.size() != UADDR_LIMIT)
        throw std::invalid_argument("WordStore needs exactly " + std::to_string(UADDR_LIMIT) +
                                    " words, got " + std::to_string(words_.size()));
}

uint64_t WordStore::at(uint32_t addr) const {
    check_uaddr(addr, "WordStore::at");
    return words_[addr];
}

GroupControlStore::GroupControlStore(const std::vector<uint64_t>& linear) : quads_(QUAD_COUNT, 0) {
    if (linear.size() != UADDR_LIMIT)
        throw std::invalid_argument("GroupControlStore needs exactly " + std::to_string(UADDR_LIMIT) +
                                    " words, got " + std::to_string(linear.size()));
    for (uint32_t addr = 0; addr < UADDR_LIMIT; ++addr) {
        if (quad_slot(addr) == 0) quads_[quad_index(addr)] = linear[addr];
        else if (linear[addr] != linear[quad_base(addr)]) ++mismatches_;
    }
}

uint64_t GroupControlStore::at(uint32_t addr) const {
    check_uaddr(addr, "GroupControlStore::at");
    return quad(quad_index(addr));
}

uint64_t GroupControlStore::quad(uint32_t index) const {
    if (index >= QUAD_COUNT)
        throw InvariantViolation("GroupControlStore::quad: quad " + std::to_string(index) +
                                 " outside MSROM range");
    return quads_[index];
}

Triad UcodeDump::triad(uint32_t addr) const {
    uint32_t base = quad_base(addr);
    check_uaddr(base, "UcodeDump::triad");
    return Triad{{words.at(base), words.at(base + 1), words.at(base + 2)}, seqwords.at(base)};
}

std::vector<uint64_t> read_ms_array(const std::string& path, size_t expected) {
    std::ifstream f(path);
    if (!f) throw DataLoadError(path, "cannot open");

    std::vector<uint64_t> out;
    out.reserve(expected);
    std::string line;
    size_t lineno = 0;
    size_t extra = 0;
    while (std::getline(f, line)) {
        ++lineno;
        // strip comment markers: # ... ; ... // ...
        auto cut = line.find_first_of("#;");
        if (cut != std::string::npos) line.resize(cut);
        cut = line.find("//");
        if (cut != std::string::npos) line.resize(cut);

        auto where = [&]() { return "line " + std::to_string(lineno); };

        // optional "ADDR:" prefix naming the index of the first word
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            uint64_t at = 0;
            if (!parse_hex_u64(trim(line.substr(0, colon)), at))
                throw DataLoadError(path, "bad address field '" + trim(line.substr(0, colon)) +
                                          "' at " + where());
            if (at != out.size() + extra)
                throw DataLoadError(path, "address " + hex_str(at, 4) + " out of order at " +
                                          where() + ", expected " + hex_str(out.size() + extra, 4));
            line = line.substr(colon + 1);
        }

        std::istringstream iss(line);
        std::string tok;
        while (iss >> tok) {
            tok.erase(std::remove(tok.begin(), tok.end(), ','), tok.end());
            if (tok.empty()) continue;

            uint64_t v = 0;
            if (!parse_hex_u64(tok, v))
                throw DataLoadError(path, "non-hex token '" + tok + "' at " + where());
            if (v > WORD_MASK)
                throw DataLoadError(path, "value '" + tok + "' wider than 48 bits at " + where());
            if (out.size() == expected) {
                ++extra;
                continue;
            }
            out.push_back(v);
        }
    }
    if (f.bad()) throw DataLoadError(path, "read error");
    if (out.size() != expected)
        throw DataLoadError(path, "truncated: " + std::to_string(out.size()) + " of " +
                                  std::to_string(expected) + " words");
    if (extra > 0)
        std::cerr << "[ms_array] warning: ignoring " << extra << " words past " << hex_str(expected, 4)
                  << " in '" << path << "'\n";
    return out;
}

UcodeDump load_ucode_dump(const std::string& data_dir, const std::string& cpuid) {
    namespace fs = std::filesystem;
    const fs::path dir = fs::path(data_dir) / cpuid;
    const std::string uops_path = (dir / "ms_array0.txt").string();
    const std::string seqw_path = (dir / "ms_array1.txt").string();

    auto uops = read_ms_array(uops_path);
    auto seqw = read_ms_array(seqw_path);

    UcodeDump dump{cpuid, WordStore(std::move(uops)), GroupControlStore(seqw)};
    if (dump.seqwords.aliased_mismatches() > 0)
        std::cerr << "[ms_array] warning: " << dump.seqwords.aliased_mismatches()
                  << " non-base entries differ from their quad base in '" << seqw_path
                  << "', using quad base values\n";
    return dump;
}
