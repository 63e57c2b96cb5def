#include "scene_renderer.h"
#include "camera.h"
#include "color_table.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

RenderStyle render_style_from(const ClientConfig& cfg)
{
    RenderStyle st;
    st.background = cfg.background;
    st.player = cfg.player;
    st.gun = cfg.gun;
    st.hud = cfg.hud;
    return st;
}

std::vector<Vec2> star_polygon(double cx, double cy, double radius, int spokes)
{
    std::vector<Vec2> pts;
    if (spokes <= 0) return pts;
    const double step = 2.0 * M_PI / spokes;
    const double offset = -step / 2.0;
    const double inner = radius * UI_STAR_INNER_RATIO;
    pts.reserve((size_t)spokes * 2);
    for (int i = 0; i < spokes; ++i) {
        double a = i * step + offset;
        pts.push_back({cx + std::cos(a) * radius, cy + std::sin(a) * radius});
        double b = a + step / 2.0;
        pts.push_back({cx + std::cos(b) * inner, cy + std::sin(b) * inner});
    }
    return pts;
}

static inline Vec2 rotate(double x, double y, double angle)
{
    double c = std::cos(angle), s = std::sin(angle);
    return {x * c - y * s, x * s + y * c};
}

std::array<Vec2, 3> ship_triangle(double sx, double sy, double heading, double scale)
{
    const double w = PHYS_PLAYER_WIDTH / 2.0 * scale;
    const double h = PHYS_PLAYER_HEIGHT / 2.0 * scale;
    const Vec2 local[3] = {{0.0, -h}, {w, h}, {-w, h}};
    std::array<Vec2, 3> out;
    for (int i = 0; i < 3; ++i) {
        Vec2 r = rotate(local[i].x, local[i].y, heading);
        out[i] = {sx + r.x, sy + r.y};
    }
    return out;
}

Vec2 gun_mount(double sx, double sy, double heading, double off_x, double off_y, double scale)
{
    Vec2 r = rotate(off_x * scale, off_y * scale, heading);
    return {sx + r.x, sy + r.y};
}

Vec2 gun_tip(const Vec2& mount, double gun_angle, double scale)
{
    const double len = PHYS_GUN_LENGTH * scale;
    return {mount.x + std::cos(gun_angle) * len, mount.y + std::sin(gun_angle) * len};
}

int stroke_width(double logical_width, double scale)
{
    return std::max(1, (int)std::lround(logical_width * 1.5 * scale));
}

std::vector<std::string> hud_lines(const SceneSnapshot& snap)
{
    char buf[128];
    std::vector<std::string> out;
    std::snprintf(buf, sizeof(buf), "Player: (%.1f, %.1f)", snap.player_x, snap.player_y);
    out.emplace_back(buf);
    std::snprintf(buf, sizeof(buf), "Camera: (%.1f, %.1f)", snap.camera_x, snap.camera_y);
    out.emplace_back(buf);
    std::snprintf(buf, sizeof(buf), "Spool: L %3.0f%%  R %3.0f%%",
                  snap.left_gun_spool * 100.0, snap.right_gun_spool * 100.0);
    out.emplace_back(buf);
    out.emplace_back("WASD/Arrows: move  Shift: boost  Ctrl: control  Alt: drift");
    out.emplace_back("Space/LMB: fire  Esc: quit");
    return out;
}

static void emit_stars(DrawList& dl, const SceneSnapshot& snap, const Camera& cam)
{
    for (const auto& st : snap.stars) {
        int sx, sy;
        world_to_screen(cam, st.x, st.y, sx, sy);
        DrawCmd c;
        c.layer = Layer::STARS;
        c.color = twinkled(star_color_rgb(st.color), st.twinkle);
        const double r = st.size * cam.scale;
        switch (st.shape) {
            case StarShape::CIRCLE:
                c.kind = DrawCmd::Kind::FILL_CIRCLE;
                c.points.push_back({(double)sx, (double)sy});
                c.radius = (int)r;
                break;
            case StarShape::FOUR_POINT:
                c.kind = DrawCmd::Kind::FILL_POLYGON;
                c.points = star_polygon(sx, sy, r, 4);
                break;
            case StarShape::SIX_POINT:
                c.kind = DrawCmd::Kind::FILL_POLYGON;
                c.points = star_polygon(sx, sy, r, 6);
                break;
        }
        dl.push_back(std::move(c));
    }
}

DrawList render_scene(const SceneSnapshot& snap, const ViewportState& vp, const RenderStyle& style)
{
    Camera cam;
    cam.scale = vp.scale_factor;
    cam.cx = snap.camera_x;
    cam.cy = snap.camera_y;

    DrawList dl;
    dl.reserve(snap.stars.size() + snap.projectiles.size() + 12);

    DrawCmd clear;
    clear.kind = DrawCmd::Kind::CLEAR;
    clear.layer = Layer::BACKGROUND;
    clear.color = style.background;
    dl.push_back(clear);

    emit_stars(dl, snap, cam);

    int px, py;
    world_to_screen(cam, snap.player_x, snap.player_y, px, py);
    const double heading = snap.player_rotation;

    const struct { double ox, oy, angle; } guns[2] = {
        {PHYS_LEFT_GUN_X, PHYS_LEFT_GUN_Y, snap.left_gun_angle},
        {PHYS_RIGHT_GUN_X, PHYS_RIGHT_GUN_Y, snap.right_gun_angle},
    };
    for (const auto& g : guns) {
        Vec2 m = gun_mount(px, py, heading, g.ox, g.oy, cam.scale);
        Vec2 t = gun_tip(m, g.angle, cam.scale);
        DrawCmd c;
        c.kind = DrawCmd::Kind::LINE;
        c.layer = Layer::GUNS;
        c.color = style.gun;
        c.points = {m, t};
        c.width = stroke_width(1.0, cam.scale);
        dl.push_back(std::move(c));
    }

    auto tri = ship_triangle(px, py, heading, cam.scale);
    DrawCmd body;
    body.kind = DrawCmd::Kind::FILL_POLYGON;
    body.layer = Layer::SHIP;
    body.color = Rgb{0, 0, 0};
    body.points.assign(tri.begin(), tri.end());
    DrawCmd hull = body;
    hull.kind = DrawCmd::Kind::OUTLINE_POLYGON;
    hull.color = style.player;
    hull.width = stroke_width(1.0, cam.scale);
    dl.push_back(std::move(body));
    dl.push_back(std::move(hull));

    for (const auto& pr : snap.projectiles) {
        double sx, sy;
        world_to_screen(cam, pr.x, pr.y, sx, sy);
        // Device length is half the logical length, centered on the shot.
        const double len = pr.length * cam.scale * 0.5;
        const double dx = std::cos(pr.rotation) * len * 0.5;
        const double dy = std::sin(pr.rotation) * len * 0.5;
        DrawCmd c;
        c.kind = DrawCmd::Kind::LINE;
        c.layer = Layer::PROJECTILES;
        c.color = pr.color;
        c.points = {{sx - dx, sy - dy}, {sx + dx, sy + dy}};
        c.width = stroke_width(pr.width, cam.scale);
        dl.push_back(std::move(c));
    }

    auto lines = hud_lines(snap);
    for (size_t i = 0; i < lines.size(); ++i) {
        DrawCmd c;
        c.kind = DrawCmd::Kind::TEXT;
        c.layer = Layer::HUD;
        c.color = style.hud.text;
        c.alpha = style.hud.text_alpha;
        c.points.push_back({(double)style.hud.x, (double)(style.hud.y + (int)i * style.hud.line_height)});
        c.text = std::move(lines[i]);
        dl.push_back(std::move(c));
    }
    return dl;
}
