#include "session.hpp"
#include <filesystem>
#include <iostream>

TraceInputs Session::inputs() const {
    return TraceInputs{dump.words, dump.seqwords, labels, uop_decoder, decode_group_control};
}

Session load_session(const Config& cfg) {
    UcodeDump dump = load_ucode_dump(cfg.data_dir, cfg.cpuid);
    LabelTable labels = load_labels(cfg.labels_path());

    OpcodeTable opcodes;
    if (std::filesystem::exists(cfg.opcodes_path())) {
        opcodes = load_opcode_table(cfg.opcodes_path());
    } else {
        std::cerr << "[opcodes] no table at '" << cfg.opcodes_path()
                  << "', opcodes print as UOP_xxx\n";
    }

    std::cerr << "[session] cpuid " << cfg.cpuid << ": " << labels.size() << " labels, "
              << opcodes.size() << " opcodes\n";
    return Session{cfg, std::move(dump), std::move(labels), UopDecoder(std::move(opcodes))};
}
