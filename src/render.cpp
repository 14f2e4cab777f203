#include "render.hpp"
#include "version.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

const Color kBackground{12, 10, 16, 255};
const Color kWallNorth{120, 96, 84, 255};
const Color kDecoration{86, 120, 70, 255};
const Color kEnemy{220, 60, 60, 255};
const Color kChest{240, 200, 60, 255};
const Color kBoss{200, 40, 200, 255};
const Color kPrefab{150, 150, 170, 255};
const Color kPlayer{90, 220, 255, 255};

Color floorShade(int variant) {
    // Slight per-variant tint so repeated tiles are visible in the preview.
    const uint8_t v = static_cast<uint8_t>(58 + (variant % 4) * 5);
    return {v, static_cast<uint8_t>(v - 4), static_cast<uint8_t>(v + 6), 255};
}

Color wallShade(int variant) {
    const uint8_t v = static_cast<uint8_t>(92 + (variant % 4) * 7);
    return {v, static_cast<uint8_t>(v - 10), static_cast<uint8_t>(v - 18), 255};
}

} // namespace

Renderer::Renderer(int windowW, int windowH, bool vsync)
    : winW(windowW), winH(windowH), vsyncEnabled(vsync) {}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(CRYPTGEN_APPNAME) + " v" + CRYPTGEN_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }

    // Fixed virtual resolution; SDL scales the final output on resize.
    SDL_RenderSetLogicalSize(renderer, winW, winH);

    initialized = true;
    return true;
}

void Renderer::shutdown() {
    if (renderer) { SDL_DestroyRenderer(renderer); renderer = nullptr; }
    if (window) { SDL_DestroyWindow(window); window = nullptr; }
    initialized = false;
}

Renderer::View Renderer::fitView(const RecordingSink& map) const {
    View v;
    for (const auto& kv : map.floor()) v.bounds.include(kv.first);
    for (const auto& kv : map.walls()) v.bounds.include(kv.first);
    if (v.bounds.empty()) return v;

    const int margin = 16;
    const int availW = std::max(1, winW - margin * 2);
    const int availH = std::max(1, winH - margin * 2 - 24); // caption strip
    v.cell = std::clamp(std::min(availW / v.bounds.width(), availH / v.bounds.height()), 1, 32);

    v.offX = (winW - v.bounds.width() * v.cell) / 2;
    v.offY = 24 + (winH - 24 - v.bounds.height() * v.cell) / 2;
    return v;
}

SDL_Rect Renderer::cellRect(const View& v, const Vec2i& p) const {
    // World +y is up; screen rows grow downward.
    SDL_Rect r;
    r.x = v.offX + (p.x - v.bounds.minX) * v.cell;
    r.y = v.offY + (v.bounds.maxY - p.y) * v.cell;
    r.w = v.cell;
    r.h = v.cell;
    return r;
}

SDL_Point Renderer::worldToScreen(const View& v, const Vec2f& p) const {
    SDL_Point s;
    s.x = v.offX + static_cast<int>(std::lround((p.x - static_cast<float>(v.bounds.minX) + 0.5f) * static_cast<float>(v.cell)));
    s.y = v.offY + static_cast<int>(std::lround((static_cast<float>(v.bounds.maxY) - p.y + 0.5f) * static_cast<float>(v.cell)));
    return s;
}

void Renderer::fillRect(const SDL_Rect& r, const Color& c) {
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    SDL_RenderFillRect(renderer, &r);
}

void Renderer::drawMarker(const View& v, const Vec2f& p, const Color& c, int inset) {
    const SDL_Point s = worldToScreen(v, p);
    const int half = std::max(1, v.cell / 2 - inset);
    const SDL_Rect r{s.x - half, s.y - half, half * 2, half * 2};
    fillRect(r, c);
}

void Renderer::drawLightGlow(const View& v, const RecordingSink::Light& l) {
    const SDL_Point s = worldToScreen(v, l.pos);
    const int radiusPx = std::max(1, static_cast<int>(l.radius * static_cast<float>(v.cell)));

    // A few concentric additive squares approximate a soft radial falloff.
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_ADD);
    const int rings = 4;
    for (int i = rings; i >= 1; --i) {
        const int rr = radiusPx * i / rings;
        const float a = std::clamp(l.intensity * 18.0f / static_cast<float>(i), 0.0f, 255.0f);
        SDL_SetRenderDrawColor(renderer, l.color.r, l.color.g, l.color.b, static_cast<Uint8>(a));
        const SDL_Rect r{s.x - rr, s.y - rr, rr * 2, rr * 2};
        SDL_RenderFillRect(renderer, &r);
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
}

void Renderer::render(const RecordingSink& map, const std::string& caption) {
    if (!initialized) return;

    SDL_SetRenderDrawColor(renderer, kBackground.r, kBackground.g, kBackground.b, 255);
    SDL_RenderClear(renderer);

    const View v = fitView(map);
    if (!v.bounds.empty()) {
        for (const auto& kv : map.floor()) fillRect(cellRect(v, kv.first), floorShade(kv.second));
        for (const auto& kv : map.walls()) {
            fillRect(cellRect(v, kv.first), kv.second.north ? kWallNorth : wallShade(kv.second.index));
        }
        for (const auto& kv : map.decorations()) {
            SDL_Rect r = cellRect(v, kv.first);
            const int in = std::max(1, r.w / 3);
            r.x += in; r.y += in; r.w -= in * 2; r.h -= in * 2;
            if (r.w > 0 && r.h > 0) fillRect(r, kDecoration);
        }

        for (const auto& l : map.lights()) drawLightGlow(v, l);

        for (const auto& p : map.prefabs()) drawMarker(v, p.pos, kPrefab, v.cell / 4);
        for (const auto& c : map.chests()) drawMarker(v, c, kChest, v.cell / 5);
        for (const auto& e : map.enemies()) drawMarker(v, e.pos, kEnemy, v.cell / 5);
        for (const auto& b : map.bosses()) drawMarker(v, b, kBoss, -v.cell);
        if (map.hasPlayerSpawn()) drawMarker(v, map.playerSpawn(), kPlayer, 0);
    }

    // No font in the preview; the caption goes to the window title.
    if (window) {
        const std::string title = std::string(CRYPTGEN_APPNAME) + " - " + caption;
        SDL_SetWindowTitle(window, title.c_str());
    }

    SDL_RenderPresent(renderer);
}

std::string Renderer::saveScreenshotBMP(const std::string& directory, const std::string& prefix) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!directory.empty()) {
        fs::create_directories(fs::path(directory), ec);
    }

    // Timestamp for filename.
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream name;
    name << prefix << "_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".bmp";

    const fs::path outPath = directory.empty() ? fs::path(name.str()) : fs::path(directory) / name.str();

    int w = 0, h = 0;
    if (SDL_GetRendererOutputSize(renderer, &w, &h) != 0) {
        w = winW;
        h = winH;
    }

    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_RGBA32);
    if (!surface) return {};

    if (SDL_RenderReadPixels(renderer, nullptr, surface->format->format, surface->pixels, surface->pitch) != 0) {
        SDL_FreeSurface(surface);
        return {};
    }

    if (SDL_SaveBMP(surface, outPath.string().c_str()) != 0) {
        SDL_FreeSurface(surface);
        return {};
    }

    SDL_FreeSurface(surface);
    return outPath.string();
}
