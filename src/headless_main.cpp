#include "recording_sink.hpp"
#include "dungeon.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Options:\n"
        << "  --config <path>               Generator config INI to load (missing file = defaults).\n"
        << "  --write-default-config <path> Write a commented default config and exit.\n"
        << "  --set <key=value>             Override a single config key (repeatable).\n"
        << "  --seed <n>                    Seed for the first run (overrides the config).\n"
        << "  --layout <graph|walk>         Layout algorithm (overrides the config).\n"
        << "  --runs <n>                    Number of dungeons to generate (1..10000). Default: 1.\n"
        << "  --ascii                       Print each dungeon as an ASCII map.\n"
        << "  --json-report <path>          Write a JSON summary report (useful for CI).\n"
        << "  --version                     Print version.\n"
        << "  --help                        Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

struct RunRecord {
    uint32_t seed = 0;
    size_t rooms = 0;
    size_t connections = 0;
    size_t floorCells = 0;
    size_t wallCells = 0;
    bool ok = false;
    GenError error = GenError::None;
    std::string message;
    GenerationStats stats;
};

static RunRecord recordOf(uint32_t seed, const GenerationResult& r) {
    RunRecord rec;
    rec.seed = seed;
    rec.rooms = r.rooms.size();
    rec.connections = r.connections.size();
    rec.floorCells = r.floorCells.size();
    rec.wallCells = r.wallCells.size();
    rec.ok = r.ok;
    rec.error = r.error;
    rec.message = r.message;
    rec.stats = r.stats;
    return rec;
}

static void printSummary(const RunRecord& r) {
    const GenerationStats& s = r.stats;
    std::cout << "seed " << r.seed << ": " << (r.ok ? "ok" : "FAILED") << "\n"
              << "  rooms " << r.rooms << " (target " << s.targetRooms
              << ", main " << s.mainPathRooms << ", branches " << s.branchRooms
              << ", skipped " << s.skippedRooms << (s.bossForced ? ", boss forced" : "") << ")\n"
              << "  connections " << r.connections << ", floor " << r.floorCells
              << ", walls " << r.wallCells << ", corridor cells " << s.corridorCells << "\n"
              << "  decorations " << s.decorations << ", lights " << s.lights
              << ", enemies " << s.enemies << ", chests " << s.chests
              << ", prefabs " << s.prefabs << "\n";
    if (!r.ok) {
        std::cout << "  error: " << genErrorName(r.error) << " (" << r.message << ")\n";
    }
}

static bool writeJsonReport(const std::filesystem::path& path,
                            const std::vector<RunRecord>& results,
                            const GenConfig& cfg,
                            std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open JSON report for writing: " + path.generic_string();
        return false;
    }

    size_t okCount = 0;
    for (const auto& r : results) if (r.ok) ++okCount;

    f << "{\n";
    f << "  \"tool\": \"CryptGenHeadless\",\n";
    f << "  \"version\": \"" << jsonEscape(CRYPTGEN_VERSION) << "\",\n";
    f << "  \"options\": {\n";
    f << "    \"layout\": \"" << layoutKindName(cfg.layout) << "\",\n";
    f << "    \"minRooms\": " << cfg.minRooms << ",\n";
    f << "    \"maxRooms\": " << cfg.maxRooms << ",\n";
    f << "    \"corridorWidth\": " << cfg.corridorWidth << ",\n";
    f << "    \"branchChance\": " << cfg.branchChance << "\n";
    f << "  },\n";
    f << "  \"summary\": {\n";
    f << "    \"total\": " << results.size() << ",\n";
    f << "    \"ok\": " << okCount << ",\n";
    f << "    \"failed\": " << (results.size() - okCount) << "\n";
    f << "  },\n";
    f << "  \"results\": [\n";

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        f << "    {\n";
        f << "      \"seed\": " << r.seed << ",\n";
        f << "      \"ok\": " << (r.ok ? "true" : "false") << ",\n";
        f << "      \"rooms\": " << r.rooms << ",\n";
        f << "      \"connections\": " << r.connections << ",\n";
        f << "      \"branchRooms\": " << r.stats.branchRooms << ",\n";
        f << "      \"skippedRooms\": " << r.stats.skippedRooms << ",\n";
        f << "      \"bossForced\": " << (r.stats.bossForced ? "true" : "false") << ",\n";
        f << "      \"floorCells\": " << r.floorCells << ",\n";
        f << "      \"wallCells\": " << r.wallCells << ",\n";
        f << "      \"decorations\": " << r.stats.decorations << ",\n";
        f << "      \"lights\": " << r.stats.lights << ",\n";
        f << "      \"enemies\": " << r.stats.enemies << ",\n";
        f << "      \"chests\": " << r.stats.chests << ",\n";
        f << "      \"prefabs\": " << r.stats.prefabs;

        if (!r.ok) {
            f << ",\n";
            f << "      \"error\": \"" << jsonEscape(genErrorName(r.error)) << "\",\n";
            f << "      \"message\": \"" << jsonEscape(r.message) << "\"\n";
        } else {
            f << "\n";
        }

        f << "    }";
        if (i + 1 < results.size()) f << ",";
        f << "\n";
    }

    f << "  ]\n";
    f << "}\n";
    return static_cast<bool>(f);
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath;
    std::string defaultConfigOut;
    std::filesystem::path jsonReport;
    std::vector<std::string> overrides;
    bool haveSeed = false;
    uint32_t seed = 0;
    bool haveLayout = false;
    LayoutKind layout = LayoutKind::Graph;
    uint32_t runs = 1;
    bool ascii = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << CRYPTGEN_APPNAME << " " << CRYPTGEN_VERSION << "\n";
            return 0;
        } else if (a == "--config") {
            if (!argValue(i, argc, argv, configPath)) {
                std::cerr << "--config requires a path\n";
                return 2;
            }
        } else if (a == "--write-default-config") {
            if (!argValue(i, argc, argv, defaultConfigOut)) {
                std::cerr << "--write-default-config requires a path\n";
                return 2;
            }
        } else if (a == "--set") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--set requires key=value\n";
                return 2;
            }
            overrides.push_back(v);
        } else if (a == "--seed") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--seed requires a value\n";
                return 2;
            }
            if (!parseU32(v, seed)) {
                std::cerr << "Invalid --seed: " << v << "\n";
                return 2;
            }
            haveSeed = true;
        } else if (a == "--layout") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--layout requires graph or walk\n";
                return 2;
            }
            if (!parseLayoutKind(v, layout)) {
                std::cerr << "Invalid --layout: " << v << "\n";
                return 2;
            }
            haveLayout = true;
        } else if (a == "--runs") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--runs requires a value\n";
                return 2;
            }
            if (!parseU32(v, runs) || runs < 1 || runs > 10000) {
                std::cerr << "Invalid --runs: " << v << "\n";
                return 2;
            }
        } else if (a == "--ascii") {
            ascii = true;
        } else if (a == "--json-report") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--json-report requires a path\n";
                return 2;
            }
            jsonReport = v;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!defaultConfigOut.empty()) {
        if (!writeDefaultConfig(defaultConfigOut)) {
            std::cerr << "writeDefaultConfig failed: " << defaultConfigOut << "\n";
            return 1;
        }
        std::cout << "Wrote " << defaultConfigOut << "\n";
        return 0;
    }

    GenConfig cfg = configPath.empty() ? GenConfig{} : loadGenConfig(configPath);
    for (const std::string& kv : overrides) {
        const auto eq = kv.find('=');
        if (eq == std::string::npos || !applyConfigKey(cfg, kv.substr(0, eq), kv.substr(eq + 1))) {
            std::cerr << "Invalid --set: " << kv << "\n";
            return 2;
        }
    }
    if (haveSeed) cfg.seed = seed;
    if (haveLayout) cfg.layout = layout;

    DungeonGenerator gen;
    RecordingSink sink;
    std::vector<RunRecord> results;
    results.reserve(runs);

    const uint32_t baseSeed = cfg.seed;
    for (uint32_t i = 0; i < runs; ++i) {
        // Run 0 uses the seed as given so a single run is reproducible by seed.
        cfg.seed = (i == 0) ? baseSeed : hashCombine(baseSeed, i);

        const GenerationResult res = gen.generate(cfg, ascii ? &sink : nullptr);
        results.push_back(recordOf(cfg.seed, res));
        printSummary(results.back());
        if (ascii) std::cout << sink.toAscii() << "\n";
    }

    if (!jsonReport.empty()) {
        std::string err;
        if (!writeJsonReport(jsonReport, results, cfg, &err)) {
            std::cerr << err << "\n";
            return 1;
        }
    }

    for (const auto& r : results) {
        if (!r.ok) return 1;
    }
    return 0;
}
