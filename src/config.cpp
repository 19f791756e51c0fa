#include "config.hpp"
#include <filesystem>

namespace fs = std::filesystem;

std::string Config::cpu_dir() const      { return (fs::path(data_dir) / cpuid).string(); }
std::string Config::labels_path() const  { return (fs::path(data_dir) / "labels.csv").string(); }
std::string Config::opcodes_path() const { return (fs::path(data_dir) / "opcodes.csv").string(); }
