#pragma once
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif
#include <SDL.h>

#include "recording_sink.hpp"

#include <string>

// SDL2 preview of a generated dungeon. Draws whatever a RecordingSink
// collected: tiles as flat colored cells, lights as additive glows, and
// entities as small markers. The map is scaled to fit the window.
class Renderer {
public:
    Renderer(int windowW, int windowH, bool vsync);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    bool init();
    void shutdown();

    void render(const RecordingSink& map, const std::string& caption);

    // Saves a BMP of the current frame.
    // Returns the full path written, or an empty string on failure.
    std::string saveScreenshotBMP(const std::string& directory, const std::string& prefix = "cryptgen_shot") const;

private:
    struct View {
        IntRect bounds;
        int cell = 8;
        int offX = 0;
        int offY = 0;
    };

    View fitView(const RecordingSink& map) const;
    SDL_Rect cellRect(const View& v, const Vec2i& p) const;
    SDL_Point worldToScreen(const View& v, const Vec2f& p) const;

    void fillRect(const SDL_Rect& r, const Color& c);
    void drawMarker(const View& v, const Vec2f& p, const Color& c, int inset);
    void drawLightGlow(const View& v, const RecordingSink::Light& l);

    int winW = 0;
    int winH = 0;
    bool vsyncEnabled = false;
    bool initialized = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
};
