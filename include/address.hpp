// include/address.hpp
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include "errors.hpp"

// MSROM address space: [0, 0x7C00), grouped into quads of 4 slots.
// Slot 3 of each quad holds the sequence word in hardware and is never
// disassembled as a uop.
static constexpr uint32_t UADDR_LIMIT = 0x7C00;
static constexpr uint32_t QUAD_SIZE   = 4;
static constexpr uint32_t QUAD_COUNT  = UADDR_LIMIT / QUAD_SIZE;

inline uint32_t quad_slot(uint32_t addr)  { return addr % QUAD_SIZE; }
inline uint32_t quad_base(uint32_t addr)  { return addr - quad_slot(addr); }
inline uint32_t quad_index(uint32_t addr) { return addr / QUAD_SIZE; }
inline bool     is_uop_slot(uint32_t addr) { return quad_slot(addr) != QUAD_SIZE - 1; }

// "U1a2c"
std::string uaddr_str(uint32_t addr);

inline void check_uaddr(uint32_t addr, const char* what) {
    if (addr >= UADDR_LIMIT)
        throw InvariantViolation(std::string(what) + ": address " + uaddr_str(addr) +
                                 " outside MSROM range");
}
