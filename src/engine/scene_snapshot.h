// Per-frame scene description handed from the engine to the renderer.
// All coordinates and sizes are logical (800x600 design space), angles in radians.
#pragma once

#include <cstdint>
#include <vector>

#include "config.h"

struct Rgb {
    uint8_t r = 0, g = 0, b = 0;
};

inline bool operator==(const Rgb& a, const Rgb& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
inline bool operator!=(const Rgb& a, const Rgb& b) { return !(a == b); }

enum class StarShape { CIRCLE, FOUR_POINT, SIX_POINT };

enum class StarColor { WHITE, LIGHT_BLUE, CYAN, LIGHT_PURPLE, PINK, PALE_YELLOW };

struct StarView {
    double x = 0.0, y = 0.0;
    double size = 2.0;       // radius
    StarColor color = StarColor::WHITE;
    StarShape shape = StarShape::CIRCLE;
    double twinkle = 1.0;    // phase value in [0,1]
};

struct ProjectileView {
    double x = 0.0, y = 0.0;
    double length = 0.0;
    double width = 0.0;
    double rotation = 0.0;
    Rgb color{255, 255, 255};
};

// Defaults below are the documented substitutions for absent fields.
struct SceneSnapshot {
    double player_x = 0.0;
    double player_y = 0.0;
    double player_rotation = 0.0;   // 0 = nose toward -y (pointing up)
    double player_vx = 0.0;
    double player_vy = 0.0;
    double camera_x = 0.0;
    double camera_y = 0.0;

    double left_gun_angle = PHYS_ANGLE_UP;
    double right_gun_angle = PHYS_ANGLE_UP;
    double left_gun_spool = 0.0;    // 0..1
    double right_gun_spool = 0.0;   // 0..1

    std::vector<StarView> stars;
    std::vector<ProjectileView> projectiles;
};

// Validate once at the engine boundary: non-finite values fall back to their
// defaults, twinkle and spools are clamped to [0,1], negative sizes become 0.
// Returns the number of fields that were replaced or clamped.
int sanitize_snapshot(SceneSnapshot& snap);
