#include "render.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "dungeon.hpp"
#include "recording_sink.hpp"
#include "settings.hpp"
#include "version.hpp"

static std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            try {
                unsigned long v = std::stoul(argv[i + 1], nullptr, 0);
                return static_cast<uint32_t>(v);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << CRYPTGEN_APPNAME << " " << CRYPTGEN_VERSION << "\n"
        << "Usage: " << (exe ? exe : "cryptgen") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           First seed to generate\n"
        << "  --config <path>      Generator config INI\n"
        << "  --layout <kind>      graph | walk\n"
        << "\n"
        << "Keys:\n"
        << "  R                    Regenerate with the next seed\n"
        << "  L                    Toggle layout (graph / walk)\n"
        << "  F12                  Save a BMP screenshot\n"
        << "  Esc                  Quit\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

static std::string captionFor(const GenConfig& cfg, const GenerationResult& res) {
    std::ostringstream ss;
    ss << layoutKindName(cfg.layout) << " seed " << cfg.seed
       << " | rooms " << res.rooms.size()
       << " branches " << res.stats.branchRooms
       << " | enemies " << res.stats.enemies
       << " chests " << res.stats.chests;
    if (res.stats.bossForced) ss << " | boss forced";
    if (!res.ok) ss << " | " << res.message;
    return ss.str();
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "cryptgen");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << CRYPTGEN_APPNAME << " " << CRYPTGEN_VERSION << "\n";
        return 0;
    }

    GenConfig cfg;
    if (const auto path = parseStringArg(argc, argv, "--config")) {
        cfg = loadGenConfig(*path);
    }
    if (const auto seed = parseSeedArg(argc, argv)) {
        cfg.seed = *seed;
    }
    if (const auto layout = parseStringArg(argc, argv, "--layout")) {
        if (!parseLayoutKind(*layout, cfg.layout)) {
            std::cerr << "Invalid --layout: " << *layout << "\n";
            return 2;
        }
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    {
        Renderer view(1280, 800, true);
        if (!view.init()) {
            SDL_Quit();
            return 1;
        }

        DungeonGenerator gen;
        RecordingSink map;

        auto regenerate = [&]() -> std::string {
            const GenerationResult res = gen.generate(cfg, &map);
            if (!res.ok) {
                std::cerr << "generate failed: " << genErrorName(res.error) << " (" << res.message << ")\n";
            }
            return captionFor(cfg, res);
        };

        std::string caption = regenerate();

        bool running = true;
        while (running) {
            SDL_Event ev;
            while (SDL_PollEvent(&ev)) {
                if (ev.type == SDL_QUIT) {
                    running = false;
                } else if (ev.type == SDL_KEYDOWN && ev.key.repeat == 0) {
                    switch (ev.key.keysym.sym) {
                        case SDLK_ESCAPE:
                            running = false;
                            break;
                        case SDLK_r:
                            cfg.seed = hashCombine(cfg.seed, tag32("REROLL"));
                            caption = regenerate();
                            break;
                        case SDLK_l:
                            cfg.layout = (cfg.layout == LayoutKind::Graph) ? LayoutKind::Walk : LayoutKind::Graph;
                            caption = regenerate();
                            break;
                        case SDLK_F12: {
                            const std::string path = view.saveScreenshotBMP("", "cryptgen_shot");
                            if (path.empty()) {
                                std::cerr << "saveScreenshotBMP failed: " << SDL_GetError() << "\n";
                            } else {
                                std::cout << "Saved " << path << "\n";
                            }
                            break;
                        }
                        default:
                            break;
                    }
                }
            }

            view.render(map, caption);
            SDL_Delay(16);
        }
    }

    SDL_Quit();
    return 0;
}
