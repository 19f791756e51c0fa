// src/cli.cpp
#include "cli.hpp"

#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "session.hpp"
#include "trace.hpp"

static void usage(std::ostream& err, const char* p) {
    err << "MSROM microcode trace disassembler\n\n"
        << "Usage: " << p << " [-c|--cpuid <id>]\n\n"
        << "  -c, --cpuid <id>   cpuid of the target CPU, selects ./<id>/ms_array{0,1}.txt\n"
        << "                     (default " << DEFAULT_CPUID << ")\n"
        << "  -h, --help         this text\n\n"
        << "Labels are read from ./labels.csv, an optional opcode table from ./opcodes.csv.\n";
}

static bool isflag(const std::string& a, const std::string& f) { return a == f; }

int run_disasm(int argc, char** argv, std::ostream& out, std::ostream& err, const Config& base) {
    const char* prog = argc > 0 ? argv[0] : "ucode_disasm";
    Config cfg = base;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto need = [&](const std::string& f)->std::string{
                if (i+1 >= argc) throw std::invalid_argument("Missing value for " + f);
                return std::string(argv[++i]);
            };

            if (isflag(a,"-c") || isflag(a,"--cpuid")) cfg.cpuid = need(a);
            else if (isflag(a,"--help") || isflag(a,"-h")) { usage(err, prog); return 0; }
            else throw std::invalid_argument("Unknown arg: " + a);
        }
    } catch (const std::invalid_argument& e) {
        err << "Error: " << e.what() << "\n\n";
        usage(err, prog);
        return 1;
    }

    try {
        Session s = load_session(cfg);
        render_trace(s.inputs(), out);
        out.flush();
        if (!out) {
            err << "[ucode_disasm] error writing output\n";
            return 1;
        }
    } catch (const DataLoadError& e) {
        err << "[ucode_disasm] failed to load '" << e.source() << "': " << e.reason() << "\n";
        return 1;
    } catch (const InvariantViolation& e) {
        err << "[ucode_disasm] internal error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
