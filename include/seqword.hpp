// include/seqword.hpp
#pragma once
#include <cstdint>
#include <string>

// Sequence word layout (one per quad, applies to slots 0..2):
//
//   29 28 27  25 24 23 22          8 7  6 5     2 1  0
//  +-----+------+-----+-------------+----+-------+----+
//  | CRC | sync | up2 |    uaddr    | up1| eflow | up0|
//  +-----+------+-----+-------------+----+-------+----+
//
//  eflow runs after slot up0; the goto to uaddr happens after slot up1
//  (up1 == 3 or uaddr == 0: no goto); sync is applied at slot up2
//  (up2 == 3: no sync).

enum class SeqwControl : uint8_t {
    None           = 0x0,
    URET0          = 0x2,
    URET1          = 0x3,
    SAVEUPIP0      = 0x4,
    SAVEUPIP1      = 0x5,
    ROVR_SAVEUPIP0 = 0x6,
    ROVR_SAVEUPIP1 = 0x7,
    WRTAGW         = 0x8,
    MSLOOP         = 0x9,
    MSSTOP         = 0xB,
    UEND0          = 0xC,
    UEND1          = 0xD,
    UEND2          = 0xE,
    UEND3          = 0xF,
};

enum class SeqwSync : uint8_t {
    None       = 0x0,
    LFNCEWAIT  = 0x1,
    LFNCEMARK  = 0x2,
    LFNCEWTMRK = 0x3,
    SYNCFULL   = 0x4,
    SYNCWAIT   = 0x5,
    SYNCMARK   = 0x6,
    SYNCWTMRK  = 0x7,
};

// Which side of the mnemonic an annotation is rendered on.
enum class SeqwPhase { Before, After };

const char* seqw_control_name(SeqwControl c);
const char* seqw_sync_name(SeqwSync s);

struct SequenceWord {
    static constexpr uint8_t NO_SLOT = 3;

    SeqwControl control{SeqwControl::None};
    uint8_t     control_slot{NO_SLOT};
    SeqwSync    sync{SeqwSync::None};
    uint8_t     sync_slot{NO_SLOT};
    uint32_t    goto_addr{0};
    uint8_t     goto_slot{NO_SLOT};

    bool has_control() const { return control_slot != NO_SLOT; }
    bool has_sync() const    { return sync_slot != NO_SLOT; }
    bool has_goto() const    { return goto_slot != NO_SLOT; }

    bool is_uend() const;
    bool is_uret() const;

    // CRC bits are not checked. Returns false (leaving `out` untouched) if
    // the word has bits above 29 set or a field does not decode.
    static bool decode(uint64_t raw, SequenceWord& out);

    bool crc_ok(uint64_t raw) const;

    // "[slot0,slot1,slot2]", e.g. "[LFNCEMARK,UEND0,GOTO U7c00]"
    std::string to_string() const;
};

// Annotation for the uop at `addr` contributed by its quad's sequence word.
// Total: an undecodable word yields "" before and "SEQW ?? <hex>" after.
std::string decode_group_control(uint32_t addr, uint64_t word, uint64_t control_word,
                                 SeqwPhase phase);
