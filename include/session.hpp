// include/session.hpp
#pragma once
#include "config.hpp"
#include "labels.hpp"
#include "trace.hpp"
#include "ucode_store.hpp"
#include "uop_decoder.hpp"

// All data one run needs, loaded up front and read-only afterwards.
struct Session {
    Config     config;
    UcodeDump  dump;
    LabelTable labels;
    UopDecoder uop_decoder;

    TraceInputs inputs() const;
};

// Loads dump arrays, labels and the optional opcode table. Throws
// DataLoadError naming the first source that fails; nothing is returned
// partially loaded.
Session load_session(const Config& cfg);
