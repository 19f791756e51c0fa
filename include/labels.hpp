// include/labels.hpp
#pragma once
#include <cstdint>
#include <map>
#include <string>

// Sparse address -> symbolic name. Annotation only, never affects decode.
class LabelTable {
public:
    // Returns false if addr already had a name (it is replaced).
    bool set(uint32_t addr, std::string name);

    const std::string* find(uint32_t addr) const;
    size_t size() const { return names_.size(); }

    const std::map<uint32_t, std::string>& entries() const { return names_; }

private:
    std::map<uint32_t, std::string> names_;
};

// CSV records "address,name", address in hex. '#' comments and an
// "address,name" header are skipped. Duplicates: last record wins.
LabelTable load_labels(const std::string& path);
