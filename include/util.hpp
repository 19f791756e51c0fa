// include/util.hpp
#pragma once
#include <cstdint>
#include <string>

// Lowercase, zero padded hex without prefix.
std::string hex_str(uint64_t v, int width);

// Strip leading/trailing spaces, tabs, CR and LF.
std::string trim(const std::string& s);

// Parses an unsigned hex token ("0x" prefix and '_' separators allowed).
// Returns false on an empty token, a non-hex digit or overflow of 64 bits.
bool parse_hex_u64(std::string tok, uint64_t& out);

// Even/odd parity as stored in the CRC bits of uops and sequence words:
// bit0 = parity of the even bits, bit1 = parity of the odd bits.
uint64_t even_odd_parity(uint64_t value);
