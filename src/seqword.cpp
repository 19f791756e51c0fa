#include "seqword.hpp"
#include "address.hpp"
#include "util.hpp"
#include <vector>

static constexpr uint64_t SEQW_MASK     = 0x3FFFFFFF; // 30 bits incl. CRC
static constexpr uint64_t SEQW_CRC_MASK = 0x0FFFFFFF;
static constexpr uint32_t GOTO_MAX      = 0x7EFF;

const char* seqw_control_name(SeqwControl c) {
    switch (c) {
        case SeqwControl::None:           return "";
        case SeqwControl::URET0:          return "URET0";
        case SeqwControl::URET1:          return "URET1";
        case SeqwControl::SAVEUPIP0:      return "SAVEUPIP0";
        case SeqwControl::SAVEUPIP1:      return "SAVEUPIP1";
        case SeqwControl::ROVR_SAVEUPIP0: return "ROVR_SAVEUPIP0";
        case SeqwControl::ROVR_SAVEUPIP1: return "ROVR_SAVEUPIP1";
        case SeqwControl::WRTAGW:         return "WRTAGW";
        case SeqwControl::MSLOOP:         return "MSLOOP";
        case SeqwControl::MSSTOP:         return "MSSTOP";
        case SeqwControl::UEND0:          return "UEND0";
        case SeqwControl::UEND1:          return "UEND1";
        case SeqwControl::UEND2:          return "UEND2";
        case SeqwControl::UEND3:          return "UEND3";
    }
    return "?";
}

const char* seqw_sync_name(SeqwSync s) {
    switch (s) {
        case SeqwSync::None:       return "";
        case SeqwSync::LFNCEWAIT:  return "LFNCEWAIT";
        case SeqwSync::LFNCEMARK:  return "LFNCEMARK";
        case SeqwSync::LFNCEWTMRK: return "LFNCEWTMRK";
        case SeqwSync::SYNCFULL:   return "SYNCFULL";
        case SeqwSync::SYNCWAIT:   return "SYNCWAIT";
        case SeqwSync::SYNCMARK:   return "SYNCMARK";
        case SeqwSync::SYNCWTMRK:  return "SYNCWTMRK";
    }
    return "?";
}

static bool valid_control(uint32_t v) {
    return v >= 0x2 && v <= 0xF && v != 0xA;
}

bool SequenceWord::is_uend() const {
    return control == SeqwControl::UEND0 || control == SeqwControl::UEND1 ||
           control == SeqwControl::UEND2 || control == SeqwControl::UEND3;
}

bool SequenceWord::is_uret() const {
    return control == SeqwControl::URET0 || control == SeqwControl::URET1;
}

bool SequenceWord::decode(uint64_t raw, SequenceWord& out) {
    if (raw & ~SEQW_MASK) return false;

    const uint32_t sync_ctrl  = (raw >> 25) & 0x7;
    const uint32_t sync_uidx  = (raw >> 23) & 0x3;
    const uint32_t goto_addr  = (raw >> 8) & 0x7FFF;
    const uint32_t goto_uidx  = (raw >> 6) & 0x3;
    const uint32_t uop_ctrl   = (raw >> 2) & 0xF;
    const uint32_t uop_uidx   = raw & 0x3;

    SequenceWord w;

    if (goto_addr > GOTO_MAX) return false;
    if (goto_addr != 0 && goto_uidx != NO_SLOT) {
        w.goto_addr = goto_addr;
        w.goto_slot = static_cast<uint8_t>(goto_uidx);
    }

    if (sync_uidx == NO_SLOT || sync_ctrl == 0) {
        // a sync value with nowhere to apply it is malformed
        if (sync_ctrl != 0) return false;
    } else {
        w.sync      = static_cast<SeqwSync>(sync_ctrl);
        w.sync_slot = static_cast<uint8_t>(sync_uidx);
    }

    if (uop_uidx == NO_SLOT) return false;
    if (uop_ctrl != 0 || uop_uidx != 0) {
        if (!valid_control(uop_ctrl)) return false;
        w.control      = static_cast<SeqwControl>(uop_ctrl);
        w.control_slot = static_cast<uint8_t>(uop_uidx);
    }

    out = w;
    return true;
}

bool SequenceWord::crc_ok(uint64_t raw) const {
    return ((raw >> 28) & 0x3) == even_odd_parity(raw & SEQW_CRC_MASK);
}

std::string SequenceWord::to_string() const {
    std::vector<std::string> text(3);
    auto push = [&](uint8_t slot, const std::string& s) {
        if (!text[slot].empty()) text[slot] += ' ';
        text[slot] += s;
    };
    if (has_control()) push(control_slot, seqw_control_name(control));
    if (has_sync())    push(sync_slot, seqw_sync_name(sync));
    if (has_goto())    push(goto_slot, "GOTO " + uaddr_str(goto_addr));
    return "[" + text[0] + "," + text[1] + "," + text[2] + "]";
}

std::string decode_group_control(uint32_t addr, uint64_t /*word*/, uint64_t control_word,
                                 SeqwPhase phase) {
    SequenceWord w;
    if (!SequenceWord::decode(control_word, w))
        return phase == SeqwPhase::After ? "SEQW ?? " + hex_str(control_word, 8) : "";

    const uint32_t slot = quad_slot(addr);
    if (phase == SeqwPhase::Before) {
        if (w.has_sync() && w.sync_slot == slot)
            return std::string(seqw_sync_name(w.sync)) + "->";
        return "";
    }

    std::string after;
    if (w.has_control() && w.control_slot == slot)
        after = std::string("SEQW ") + seqw_control_name(w.control);
    if (w.has_goto() && w.goto_slot == slot) {
        if (!after.empty()) after += ' ';
        after += "SEQW GOTO " + uaddr_str(w.goto_addr);
    }
    return after;
}
