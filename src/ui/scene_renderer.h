// Pure mapping from an engine snapshot to device-space draw commands.
// Nothing here touches SDL; SdlPainter executes the result.
#pragma once

#include <array>
#include <string>
#include <vector>

#include "config_loader.h"
#include "draw_list.h"
#include "scene_snapshot.h"
#include "viewport.h"

struct RenderStyle {
    Rgb background{UI_BG_R, UI_BG_G, UI_BG_B};
    Rgb player{UI_PLAYER_R, UI_PLAYER_G, UI_PLAYER_B};
    Rgb gun{UI_GUN_R, UI_GUN_G, UI_GUN_B};
    HudStyle hud;
};

RenderStyle render_style_from(const ClientConfig& cfg);

// Star outline around (cx, cy): spokes=4 gives 8 vertices, spokes=6 gives
// 12, alternating outer (radius) and inner (0.4 * radius) points.
std::vector<Vec2> star_polygon(double cx, double cy, double radius, int spokes);

// Hull triangle: tip (0,-h), rear corners (+-w, h), rotated by heading
// (0 = nose up) and translated to (sx, sy). Device units.
std::array<Vec2, 3> ship_triangle(double sx, double sy, double heading, double scale);

// Gun mount point: ship-relative logical offset, scaled, rotated by the
// hull heading, added to the ship's screen position.
Vec2 gun_mount(double sx, double sy, double heading, double off_x, double off_y, double scale);

// Barrel end for a gun at 'mount'; follows the gun's own angle only.
Vec2 gun_tip(const Vec2& mount, double gun_angle, double scale);

// Stroke width for a logical width w: max(1, round(w * 1.5 * scale)).
int stroke_width(double logical_width, double scale);

std::vector<std::string> hud_lines(const SceneSnapshot& snap);

DrawList render_scene(const SceneSnapshot& snap, const ViewportState& vp, const RenderStyle& style);
