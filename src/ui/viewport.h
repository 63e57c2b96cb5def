// Window sizing under the locked 4:3 aspect ratio, and ownership of the
// SDL display resources that depend on it.
#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <string>

#include "config.h"
#include "config_loader.h"

struct ViewportState {
    int width = UI_LOGICAL_W;
    int height = UI_LOGICAL_H;
    double scale_factor = 1.0;          // width / logical_width
    int logical_width = UI_LOGICAL_W;
    int logical_height = UI_LOGICAL_H;
    int glyph_size = UI_BASE_GLYPH_SIZE;
};

// Builds the state for an already-corrected size.
ViewportState make_viewport(int width, int height, int base_glyph = UI_BASE_GLYPH_SIZE);

// First window size from the monitor's usable area: 90% of the binding
// dimension, the other derived from 4:3.
ViewportState initial_viewport(int monitor_w, int monitor_h, int base_glyph = UI_BASE_GLYPH_SIZE);

// Snaps a requested size back onto 4:3. Too wide: height follows width.
// Too tall: width follows height.
ViewportState corrected_viewport(int req_w, int req_h, int base_glyph = UI_BASE_GLYPH_SIZE);

// True when the window manager left the window at a size other than the
// corrected one, so the window itself must be resized back onto 4:3.
bool needs_window_snap(const ViewportState& corrected, int req_w, int req_h);

class ViewportScaler {
public:
    ViewportScaler() = default;
    ~ViewportScaler();
    ViewportScaler(const ViewportScaler&) = delete;
    ViewportScaler& operator=(const ViewportScaler&) = delete;

    // Creates the window, renderer and HUD font. SDL and TTF must already
    // be initialized. Returns false with err set on any SDL failure.
    bool open(const ClientConfig& cfg, std::string* err = nullptr);

    // Applies a window-manager resize request. The window is snapped to the
    // corrected size whenever the request is off 4:3; the font and renderer
    // are rebuilt only when the corrected size changes. Returns false when
    // the renderer could not be rebuilt.
    bool handle_resize(int req_w, int req_h, std::string* err = nullptr);

    const ViewportState& state() const { return state_; }
    double scale() const { return state_.scale_factor; }

    SDL_Window* window() const { return win_; }
    SDL_Renderer* renderer() const { return ren_; }
    TTF_Font* font() const { return font_; }   // may be null: HUD text is skipped

private:
    bool rebuild_renderer(std::string* err);
    void reopen_font();
    void set_icon(const std::string& path);

    ViewportState state_;
    std::string font_path_;
    int base_glyph_ = UI_BASE_GLYPH_SIZE;

    SDL_Window* win_ = nullptr;
    SDL_Renderer* ren_ = nullptr;
    TTF_Font* font_ = nullptr;
};
