#include "trace.hpp"
#include "labels.hpp"
#include "ucode_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <exception>
#include <ostream>
#include <thread>

TraceSlot decode_slot(const TraceInputs& in, uint32_t addr) {
    check_uaddr(addr, "decode_slot");
    const uint32_t base = quad_base(addr);
    check_uaddr(base, "decode_slot quad base");

    TraceSlot s;
    s.word         = in.words.at(addr);
    s.control_word = in.seqwords.at(base);
    s.before   = trim(in.decode_group_control(addr, s.word, s.control_word, SeqwPhase::Before));
    s.mnemonic = trim(in.decode_uop(s.word, addr));
    s.after    = trim(in.decode_group_control(addr, s.word, s.control_word, SeqwPhase::After));
    return s;
}

std::string format_data_line(uint32_t addr, const TraceSlot& slot) {
    std::string line = uaddr_str(addr) + ": " + hex_str(slot.word, 12) + " ";
    if (!slot.before.empty()) line += slot.before + " ";
    line += slot.mnemonic + " " + slot.after;
    return line;
}

// Decodes addrs[i] into out[i]; each worker takes a strided share.
static void decode_all(const TraceInputs& in, const std::vector<uint32_t>& addrs,
                       std::vector<TraceSlot>& out, unsigned jobs) {
    out.resize(addrs.size());
    if (jobs <= 1 || addrs.size() < 2) {
        for (size_t i = 0; i < addrs.size(); ++i) out[i] = decode_slot(in, addrs[i]);
        return;
    }

    jobs = std::min<unsigned>(jobs, static_cast<unsigned>(addrs.size()));
    std::vector<std::thread> workers;
    std::vector<std::exception_ptr> errors(jobs);
    try {
        for (unsigned t = 0; t < jobs; ++t) {
            workers.emplace_back([&, t]() {
                try {
                    for (size_t i = t; i < addrs.size(); i += jobs) out[i] = decode_slot(in, addrs[i]);
                } catch (...) {
                    errors[t] = std::current_exception();
                }
            });
        }
    } catch (...) {
        // threads already running still reference locals
        for (auto& w : workers) w.join();
        throw;
    }
    for (auto& w : workers) w.join();
    for (auto& e : errors)
        if (e) std::rethrow_exception(e);
}

std::vector<TraceLine> build_trace(const TraceInputs& in, const TraceOptions& opt) {
    if (opt.end > UADDR_LIMIT)
        throw InvariantViolation("build_trace: end " + uaddr_str(opt.end) + " beyond MSROM range");

    std::vector<uint32_t> visited;
    visited.reserve(opt.end);
    for (uint32_t a = 0; a < opt.end; ++a)
        if (is_uop_slot(a)) visited.push_back(a);

    std::vector<TraceSlot> slots;
    decode_all(in, visited, slots, opt.jobs);

    std::vector<TraceLine> lines;
    lines.reserve(visited.size() * 5 / 4);
    for (size_t i = 0; i < visited.size(); ++i) {
        const uint32_t a = visited[i];
        check_uaddr(a, "build_trace");

        if (quad_slot(a) == 0 && a > 0)
            lines.push_back(TraceLine{TraceLineKind::Blank, a, 0, ""});

        if (const std::string* name = in.labels.find(a))
            lines.push_back(TraceLine{TraceLineKind::Label, a, 0, *name + ":"});

        lines.push_back(TraceLine{TraceLineKind::Data, a, slots[i].word, format_data_line(a, slots[i])});
    }
    return lines;
}

void render_trace(const TraceInputs& in, std::ostream& os, const TraceOptions& opt) {
    for (const auto& l : build_trace(in, opt)) os << l.text << '\n';
}
