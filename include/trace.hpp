// include/trace.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>
#include "address.hpp"
#include "seqword.hpp"

class WordStore;
class GroupControlStore;
class LabelTable;

using UopDecodeFn = std::function<std::string(uint64_t word, uint32_t addr)>;
using GroupControlDecodeFn =
    std::function<std::string(uint32_t addr, uint64_t word, uint64_t control_word, SeqwPhase phase)>;

// Everything the trace reads. Decoders must be pure: with jobs > 1 they are
// called concurrently.
struct TraceInputs {
    const WordStore&         words;
    const GroupControlStore& seqwords;
    const LabelTable&        labels;
    UopDecodeFn              decode_uop;
    GroupControlDecodeFn     decode_group_control;
};

struct TraceOptions {
    uint32_t end{UADDR_LIMIT};   // exclusive, at most UADDR_LIMIT
    unsigned jobs{1};
};

enum class TraceLineKind { Blank, Label, Data };

struct TraceLine {
    TraceLineKind kind;
    uint32_t      address;   // Blank: base of the quad it opens
    uint64_t      word;      // Data only
    std::string   text;      // without newline
};

// Trimmed decoder output for one visited slot.
struct TraceSlot {
    uint64_t    word{0};
    uint64_t    control_word{0};
    std::string before;
    std::string mnemonic;
    std::string after;
};

TraceSlot decode_slot(const TraceInputs& in, uint32_t addr);

// "U0004: 0000deadbeef LFNCEMARK-> UOP_123 r01 SEQW UEND0"
std::string format_data_line(uint32_t addr, const TraceSlot& slot);

// Walks [0, opt.end), skipping slot 3 of each quad. Throws
// InvariantViolation if an address or quad base leaves the MSROM range.
std::vector<TraceLine> build_trace(const TraceInputs& in, const TraceOptions& opt = {});

void render_trace(const TraceInputs& in, std::ostream& os, const TraceOptions& opt = {});
