// include/config.hpp
#pragma once
#include <string>

static constexpr const char* DEFAULT_CPUID = "0x000506CA";

// Run configuration, passed explicitly to the loaders.
struct Config {
    std::string cpuid{DEFAULT_CPUID};
    std::string data_dir{"."};

    std::string cpu_dir() const;        // <data_dir>/<cpuid>
    std::string labels_path() const;   // <data_dir>/labels.csv
    std::string opcodes_path() const;   // <data_dir>/opcodes.csv
};
