// gui/app.cpp
// SDL2 + Dear ImGui browser for an MSROM trace (SDL_Renderer2 backend)
#include <filesystem>
#include <cstdio>
#include <vector>
#include <string>
#include <cstdint>
#include <algorithm>
#include <memory>
#include <thread>

#include <SDL.h>

#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"

#include "errors.hpp"
#include "seqword.hpp"
#include "session.hpp"
#include "util.hpp"

// Helper: give windows an initial position/size (first run only).
static inline void PlaceFirstUse(const ImVec2& pos, const ImVec2& size) {
    ImGui::SetNextWindowPos(pos, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(size, ImGuiCond_FirstUseEver);
}

// Index of the first line at or after `addr` (label line if it has one).
static int lineForAddress(const std::vector<TraceLine>& lines, uint32_t addr) {
    auto it = std::lower_bound(lines.begin(), lines.end(), addr,
        [](const TraceLine& l, uint32_t a) { return l.address < a; });
    if (it == lines.end()) return static_cast<int>(lines.size()) - 1;
    // a quad's blank separator carries the same address as its first uop
    while (it != lines.end() && it->kind == TraceLineKind::Blank) ++it;
    return static_cast<int>(it - lines.begin());
}

static void detailView(const Session& s, uint32_t addr) {
    const uint64_t word = s.dump.words.at(addr);
    const uint64_t seqw = s.dump.seqwords.at(addr);
    const UopFields f = UopFields::extract(word);

    ImGui::Text("%s  slot %u of quad %s", uaddr_str(addr).c_str(), quad_slot(addr),
                uaddr_str(quad_base(addr)).c_str());
    if (const std::string* name = s.labels.find(addr)) ImGui::Text("label: %s", name->c_str());
    ImGui::Separator();

    ImGui::Text("uop   %s  crc %s", hex_str(word, 12).c_str(), uop_crc_ok(word) ? "ok" : "BAD");
    ImGui::Text("opcode %03X  dst %02X  src0 %02X  src1 %02X", f.opcode, f.dst, f.src0, f.src1);
    if (f.src1_imm) ImGui::Text("imm    %04X", f.imm);
    ImGui::Text("%s", s.uop_decoder(word, addr).c_str());
    ImGui::Separator();

    SequenceWord w;
    if (SequenceWord::decode(seqw, w)) {
        ImGui::Text("seqw  %s  crc %s", hex_str(seqw, 8).c_str(), w.crc_ok(seqw) ? "ok" : "BAD");
        ImGui::Text("%s", w.to_string().c_str());
        if (w.is_uend()) ImGui::Text("ends the flow");
        if (w.is_uret()) ImGui::Text("returns from subroutine");
    } else {
        ImGui::Text("seqw  %s  (does not decode)", hex_str(seqw, 8).c_str());
    }
}

int main(int argc, char** argv) {
    Config cfg;
    if (argc > 1) cfg.cpuid = argv[1];

    // load before opening a window so a bad dump fails fast on the console
    std::vector<TraceLine> lines;
    std::unique_ptr<Session> session;
    try {
        session = std::make_unique<Session>(load_session(cfg));
        TraceOptions opt;
        opt.jobs = std::max(1u, std::thread::hardware_concurrency());
        lines = build_trace(session->inputs(), opt);
    } catch (const DataLoadError& e) {
        std::fprintf(stderr, "[ucode_viewer] failed to load '%s': %s\n", e.source().c_str(), e.reason().c_str());
        return 1;
    } catch (const InvariantViolation& e) {
        std::fprintf(stderr, "[ucode_viewer] internal error: %s\n", e.what());
        return 2;
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "SDL Error: %s\n", SDL_GetError());
        return 1;
    }

    std::string title = "MSROM trace - " + cfg.cpuid;
    SDL_Window* window = SDL_CreateWindow(
        title.c_str(),
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1800, 1100,
        SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) { std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError()); SDL_Quit(); return 1; }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) { std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError()); SDL_DestroyWindow(window); SDL_Quit(); return 1; }

    // --- ImGui init ---
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.FontGlobalScale = 2.0f;

    {
        const char* kFont = "RobotoMono-Medium.ttf"; // copied via CMake (optional)
        if (std::filesystem::exists(kFont)) {
            io.Fonts->AddFontFromFileTTF(kFont, 24.0f);
        } else {
            ImFontConfig cfgFont; cfgFont.SizePixels = 22.0f;
            io.Fonts->AddFontDefault(&cfgFont);
        }
    }

    ImGui::StyleColorsDark();
    ImGui::GetStyle().ScaleAllSizes(1.2f);

    if (!ImGui_ImplSDL2_InitForSDLRenderer(window, renderer)) {
        std::fprintf(stderr, "ImGui_ImplSDL2_InitForSDLRenderer failed\n");
        SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }
    if (!ImGui_ImplSDLRenderer2_Init(renderer)) {
        std::fprintf(stderr, "ImGui_ImplSDLRenderer2_Init failed\n");
        ImGui_ImplSDL2_Shutdown(); SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }

    const Session& s = *session;
    bool running = true;
    uint32_t selected = 0;
    int scrollTo = -1;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) running = false;
            if (event.type == SDL_WINDOWEVENT &&
                event.window.event == SDL_WINDOWEVENT_CLOSE &&
                event.window.windowID == SDL_GetWindowID(window)) running = false;
        }

        ImGui_ImplSDL2_NewFrame();
        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui::NewFrame();

        // ---- Listing ----
        PlaceFirstUse({20,20}, {1100,1040});
        ImGui::Begin("Trace");
        static char gotoBuf[8] = "0000";
        ImGui::SetNextItemWidth(180);
        if (ImGui::InputText("Goto (hex)", gotoBuf, IM_ARRAYSIZE(gotoBuf),
            ImGuiInputTextFlags_CharsHexadecimal | ImGuiInputTextFlags_EnterReturnsTrue)) {
            uint64_t v = 0;
            if (parse_hex_u64(gotoBuf, v) && v < UADDR_LIMIT) {
                selected = static_cast<uint32_t>(is_uop_slot(static_cast<uint32_t>(v)) ? v : v - 1);
                scrollTo = lineForAddress(lines, selected);
            }
        }
        ImGui::SameLine();
        ImGui::Text("%zu lines", lines.size());

        ImGui::BeginChild("listing", ImVec2(0, 0), true);
        if (scrollTo >= 0) {
            ImGui::SetScrollY(scrollTo * ImGui::GetTextLineHeightWithSpacing());
            scrollTo = -1;
        }
        ImGuiListClipper clipper;
        clipper.Begin(static_cast<int>(lines.size()));
        while (clipper.Step()) {
            for (int i = clipper.DisplayStart; i < clipper.DisplayEnd; ++i) {
                const TraceLine& l = lines[i];
                ImGui::PushID(i);
                switch (l.kind) {
                    case TraceLineKind::Blank:
                        ImGui::TextUnformatted("");
                        break;
                    case TraceLineKind::Label:
                        ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.3f, 1.0f), "%s", l.text.c_str());
                        break;
                    case TraceLineKind::Data:
                        if (ImGui::Selectable(l.text.c_str(), l.address == selected))
                            selected = l.address;
                        break;
                }
                ImGui::PopID();
            }
        }
        ImGui::EndChild();
        ImGui::End();

        // ---- Detail ----
        PlaceFirstUse({1140,20}, {640,420});
        ImGui::Begin("Slot");
        detailView(s, selected);
        ImGui::End();

        // ---- Labels ----
        PlaceFirstUse({1140,460}, {640,600});
        ImGui::Begin("Labels");
        static char filter[64] = "";
        ImGui::InputText("Filter", filter, IM_ARRAYSIZE(filter));
        ImGui::BeginChild("labels", ImVec2(0, 0), true);
        for (const auto& [addr, name] : s.labels.entries()) {
            if (filter[0] && name.find(filter) == std::string::npos) continue;
            std::string item = uaddr_str(addr) + "  " + name;
            if (!is_uop_slot(addr)) item += "  (not disassembled)";
            if (ImGui::Selectable(item.c_str(), addr == selected) && is_uop_slot(addr)) {
                selected = addr;
                scrollTo = lineForAddress(lines, addr);
            }
        }
        ImGui::EndChild();
        ImGui::End();

        ImGui::Render();
        SDL_SetRenderDrawColor(renderer, 25, 25, 25, 255);
        SDL_RenderClear(renderer);
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
