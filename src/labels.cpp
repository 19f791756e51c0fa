#include "labels.hpp"
#include "address.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>

bool LabelTable::set(uint32_t addr, std::string name) {
    auto it = names_.find(addr);
    if (it != names_.end()) {
        it->second = std::move(name);
        return false;
    }
    names_.emplace(addr, std::move(name));
    return true;
}

const std::string* LabelTable::find(uint32_t addr) const {
    auto it = names_.find(addr);
    return it == names_.end() ? nullptr : &it->second;
}

LabelTable load_labels(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw DataLoadError(path, "cannot open");

    LabelTable table;
    std::string line;
    size_t lineno = 0;
    bool first = true;
    while (std::getline(f, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto where = [&]() { return "line " + std::to_string(lineno); };

        auto comma = line.find(',');
        if (comma == std::string::npos)
            throw DataLoadError(path, "missing ',' at " + where());

        std::string saddr = trim(line.substr(0, comma));
        std::string name  = trim(line.substr(comma + 1));

        std::string lower = saddr;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        bool header = first && lower == "address";
        first = false;
        if (header) continue;

        uint64_t addr = 0;
        if (!parse_hex_u64(saddr, addr))
            throw DataLoadError(path, "bad address '" + saddr + "' at " + where());
        if (addr > UINT32_MAX)
            throw DataLoadError(path, "address " + saddr + " too large at " + where());
        if (name.empty())
            throw DataLoadError(path, "empty label name at " + where());
        // MSRAM and other non-ROM labels are kept but never reached by the trace
        if (addr >= UADDR_LIMIT)
            std::cerr << "[labels] note: " << uaddr_str(static_cast<uint32_t>(addr)) << " ('" << name
                      << "') is outside MSROM and will not be printed\n";

        if (!table.set(static_cast<uint32_t>(addr), name))
            std::cerr << "[labels] warning: duplicate label for " << uaddr_str(static_cast<uint32_t>(addr))
                      << " at " << path << ":" << lineno << ", keeping '" << name << "'\n";
    }
    if (f.bad()) throw DataLoadError(path, "read error");
    return table;
}
