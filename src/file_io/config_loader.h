// Loads client configuration from config/client.json with safe defaults.
#pragma once

#include <cstdint>
#include <string>

#include "config.h"
#include "engine_config.h"
#include "scene_snapshot.h"

struct HudStyle {
    int x = UI_HUD_X_DEFAULT;
    int y = UI_HUD_Y_DEFAULT;
    int line_height = UI_HUD_LINE_HEIGHT_DEFAULT;
    Rgb text{UI_HUD_TEXT_R, UI_HUD_TEXT_G, UI_HUD_TEXT_B};
    uint8_t text_alpha = UI_HUD_TEXT_A;
};

struct ClientConfig {
    std::string title = UI_TITLE_DEFAULT;
    int fps_cap = UI_FPS_DEFAULT;
    std::string icon_path;        // optional window icon (any SDL_image format)
    std::string font_path;        // TTF for the HUD; empty -> HUD text is skipped
    int font_base_size = UI_BASE_GLYPH_SIZE;

    HudStyle hud;
    Rgb background{UI_BG_R, UI_BG_G, UI_BG_B};
    Rgb player{UI_PLAYER_R, UI_PLAYER_G, UI_PLAYER_B};
    Rgb gun{UI_GUN_R, UI_GUN_G, UI_GUN_B};

    EngineConfig engine;
};

// Reads the JSON file at path and overlays it on 'out'. A missing file keeps
// the defaults and returns true. A file that exists but cannot be parsed, or
// whose root is not an object, returns false and sets err.
bool load_client_config(const char* path, ClientConfig& out, std::string* err = nullptr);

// Same overlay rules, from in-memory JSON text.
bool parse_client_config(const std::string& text, ClientConfig& out, std::string* err = nullptr);
