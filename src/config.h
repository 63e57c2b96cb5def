// Simple compile-time configuration parameters
#pragma once

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

// Logical design resolution; every scene coordinate lives in this space
#define UI_LOGICAL_W 800
#define UI_LOGICAL_H 600

// Locked aspect ratio (width / height)
#define UI_ASPECT_RATIO (4.0 / 3.0)

// Share of the binding monitor dimension used by the initial window
#define UI_MONITOR_FILL 0.9

// HUD glyph size in logical units (scaled with the window)
#define UI_BASE_GLYPH_SIZE 36

#define UI_FPS_DEFAULT 60
#define UI_TITLE_DEFAULT "starlance"

// HUD block anchor and line spacing (device pixels, never scaled)
#define UI_HUD_X_DEFAULT 10
#define UI_HUD_Y_DEFAULT 10
#define UI_HUD_LINE_HEIGHT_DEFAULT 30

#define UI_BG_R 20
#define UI_BG_G 20
#define UI_BG_B 30

#define UI_PLAYER_R 0
#define UI_PLAYER_G 255
#define UI_PLAYER_B 0

#define UI_GUN_R 140
#define UI_GUN_G 255
#define UI_GUN_B 140

#define UI_HUD_TEXT_R 255
#define UI_HUD_TEXT_G 255
#define UI_HUD_TEXT_B 255
#define UI_HUD_TEXT_A 255

// World angle of a gun pointing toward -y (atan2 convention, y down)
#define PHYS_ANGLE_UP (-M_PI / 2.0)

// Ship hull in logical pixels
#define PHYS_PLAYER_WIDTH 15.0
#define PHYS_PLAYER_HEIGHT 20.0

// Gun mounts, ship-relative, logical pixels
#define PHYS_LEFT_GUN_X 7.5
#define PHYS_LEFT_GUN_Y 10.0
#define PHYS_RIGHT_GUN_X (-7.5)
#define PHYS_RIGHT_GUN_Y 10.0
#define PHYS_GUN_LENGTH 10.0

// Star polygon inner/outer radius ratio
#define UI_STAR_INNER_RATIO 0.4
