#include "viewport.h"
#include "our_debug.h"

#include <SDL_image.h>

#include <algorithm>

ViewportState make_viewport(int width, int height, int base_glyph)
{
    ViewportState vs;
    vs.width = width;
    vs.height = height;
    vs.scale_factor = (double)width / (double)vs.logical_width;
    vs.glyph_size = std::max(1, (int)(base_glyph * vs.scale_factor));
    return vs;
}

ViewportState initial_viewport(int monitor_w, int monitor_h, int base_glyph)
{
    double w, h;
    if (monitor_h > 0 && (double)monitor_w / (double)monitor_h > UI_ASPECT_RATIO) {
        h = monitor_h * UI_MONITOR_FILL;
        w = h * UI_ASPECT_RATIO;
    } else {
        w = monitor_w * UI_MONITOR_FILL;
        h = w / UI_ASPECT_RATIO;
    }
    int iw = std::max(1, (int)w);
    int ih = std::max(1, (int)h);
    return make_viewport(iw, ih, base_glyph);
}

ViewportState corrected_viewport(int req_w, int req_h, int base_glyph)
{
    req_w = std::max(1, req_w);
    req_h = std::max(1, req_h);
    double ratio = (double)req_w / (double)req_h;
    int w = req_w, h = req_h;
    if (ratio > UI_ASPECT_RATIO) h = (int)(req_w / UI_ASPECT_RATIO);
    else if (ratio < UI_ASPECT_RATIO) w = (int)(req_h * UI_ASPECT_RATIO);
    return make_viewport(std::max(1, w), std::max(1, h), base_glyph);
}

bool needs_window_snap(const ViewportState& corrected, int req_w, int req_h)
{
    return corrected.width != req_w || corrected.height != req_h;
}

ViewportScaler::~ViewportScaler()
{
    if (font_) TTF_CloseFont(font_);
    if (ren_) SDL_DestroyRenderer(ren_);
    if (win_) SDL_DestroyWindow(win_);
}

bool ViewportScaler::open(const ClientConfig& cfg, std::string* err)
{
    font_path_ = cfg.font_path;
    base_glyph_ = cfg.font_base_size;

    SDL_Rect usable{0, 0, UI_LOGICAL_W, UI_LOGICAL_H};
    if (SDL_GetDisplayUsableBounds(0, &usable) != 0) {
        DBG("SDL_GetDisplayUsableBounds: %s; assuming %dx%d", SDL_GetError(), usable.w, usable.h);
    }
    state_ = initial_viewport(usable.w, usable.h, base_glyph_);

    win_ = SDL_CreateWindow(cfg.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                            state_.width, state_.height, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!win_) {
        if (err) *err = std::string("SDL_CreateWindow: ") + SDL_GetError();
        return false;
    }
    if (!cfg.icon_path.empty()) set_icon(cfg.icon_path);

    if (!rebuild_renderer(err)) return false;
    reopen_font();
    NOTE("ui", "window %dx%d scale=%.3f glyph=%d (monitor %dx%d)",
         state_.width, state_.height, state_.scale_factor, state_.glyph_size, usable.w, usable.h);
    return true;
}

bool ViewportScaler::handle_resize(int req_w, int req_h, std::string* err)
{
    ViewportState next = corrected_viewport(req_w, req_h, base_glyph_);
    const bool snap = needs_window_snap(next, req_w, req_h);
    if (next.width == state_.width && next.height == state_.height) {
        if (snap) {
            SDL_SetWindowSize(win_, state_.width, state_.height);
            DBG("resize %dx%d snapped back to %dx%d", req_w, req_h, state_.width, state_.height);
        }
        return true;
    }

    state_ = next;
    reopen_font();
    if (!rebuild_renderer(err)) return false;
    if (snap) SDL_SetWindowSize(win_, state_.width, state_.height);
    NOTE("ui", "resize %dx%d -> %dx%d scale=%.3f glyph=%d",
         req_w, req_h, state_.width, state_.height, state_.scale_factor, state_.glyph_size);
    return true;
}

bool ViewportScaler::rebuild_renderer(std::string* err)
{
    if (ren_) { SDL_DestroyRenderer(ren_); ren_ = nullptr; }
    ren_ = SDL_CreateRenderer(win_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!ren_) {
        if (err) *err = std::string("SDL_CreateRenderer: ") + SDL_GetError();
        return false;
    }
    SDL_SetRenderDrawBlendMode(ren_, SDL_BLENDMODE_BLEND);
    return true;
}

void ViewportScaler::reopen_font()
{
    if (font_) { TTF_CloseFont(font_); font_ = nullptr; }
    if (font_path_.empty()) return;
    font_ = TTF_OpenFont(font_path_.c_str(), state_.glyph_size);
    if (!font_) ERROR("TTF_OpenFont(%s, %d): %s", font_path_.c_str(), state_.glyph_size, TTF_GetError());
}

void ViewportScaler::set_icon(const std::string& path)
{
    SDL_Surface* icon = IMG_Load(path.c_str());
    if (!icon) {
        ERROR("IMG_Load(%s): %s", path.c_str(), IMG_GetError());
        return;
    }
    SDL_SetWindowIcon(win_, icon);
    SDL_FreeSurface(icon);
}
