#include "util.hpp"
#include "address.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

std::string hex_str(uint64_t v, int width) {
    std::ostringstream o;
    o << std::hex << std::setfill('0') << std::setw(width) << v;
    return o.str();
}

std::string uaddr_str(uint32_t addr) {
    return "U" + hex_str(addr, 4);
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool parse_hex_u64(std::string tok, uint64_t& out) {
    tok.erase(std::remove(tok.begin(), tok.end(), '_'), tok.end());
    if (tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X'))
        tok = tok.substr(2);
    if (tok.empty() || tok.size() > 16) return false;

    uint64_t v = 0;
    for (char c : tok) {
        int d;
        if (c >= '0' && c <= '9')      d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
        else return false;
        v = (v << 4) | static_cast<uint64_t>(d);
    }
    out = v;
    return true;
}

uint64_t even_odd_parity(uint64_t value) {
    uint64_t result = 0;
    while (value > 0) {
        result ^= value & 3;
        value >>= 2;
    }
    return result;
}
