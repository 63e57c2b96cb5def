#include "config_loader.h"
#include "our_debug.h"
#include "errors.h"
#include "json_interface.h"

#include <fstream>
#include <cstdio>

// Model implementing JsonInterface to minimize loader boilerplate
struct ClientConfigModel : public JsonInterface {
    ClientConfig cfg; // initialized with defaults before parse

    bool from_json(const JsonView& root, std::string* err) override {
        if (!root.is_object()) { if (err) *err = "Top-level must be an object"; return false; }

        (void)get_json_value(root, "title", &cfg.title);
        (void)get_json_value(root, "fps_cap", &cfg.fps_cap);
        (void)get_json_value(root, "icon", &cfg.icon_path);

        JsonView fonts; if (root.get_view("fonts", fonts) && fonts.is_object()) {
            (void)get_json_value(fonts, "path", &cfg.font_path);
            (void)get_json_value(fonts, "base_size", &cfg.font_base_size);
        }

        JsonView hud; if (root.get_view("hud", hud) && hud.is_object()) {
            (void)get_json_value(hud, "x", &cfg.hud.x);
            (void)get_json_value(hud, "y", &cfg.hud.y);
            (void)get_json_value(hud, "line_height", &cfg.hud.line_height);
            (void)get_json_rgba(hud, "text", &cfg.hud.text, &cfg.hud.text_alpha);
        }

        JsonView colors; if (root.get_view("colors", colors) && colors.is_object()) {
            (void)get_json_rgba(colors, "background", &cfg.background);
            (void)get_json_rgba(colors, "player", &cfg.player);
            (void)get_json_rgba(colors, "gun", &cfg.gun);
        }

        JsonView jeng; if (root.get_view("engine", jeng) && jeng.is_object()) {
            read_engine(jeng);
        }
        return true;
    }

    void read_engine(const JsonView& jeng) {
        EngineConfig& e = cfg.engine;
        (void)get_json_value(jeng, "seed", &e.seed);

        JsonView jp; if (jeng.get_view("player", jp) && jp.is_object()) {
            (void)get_json_value(jp, "top_speed", &e.player.top_speed);
            (void)get_json_value(jp, "accel", &e.player.accel);
            (void)get_json_value(jp, "drag", &e.player.drag);
            (void)get_json_value(jp, "boost_multiplier", &e.player.boost_multiplier);
            (void)get_json_value(jp, "control_speed_scale", &e.player.control_speed_scale);
            (void)get_json_value(jp, "ang_accel", &e.player.ang_accel);
            (void)get_json_value(jp, "ang_vel_max", &e.player.ang_vel_max);
        }

        JsonView jg; if (jeng.get_view("gun", jg) && jg.is_object()) {
            (void)get_json_value(jg, "rotation_speed", &e.gun.rotation_speed);
            (void)get_json_value(jg, "arc_degrees", &e.gun.arc_degrees);
            (void)get_json_value(jg, "spool_up_time", &e.gun.spool_up_time);
            (void)get_json_value(jg, "spool_down_time", &e.gun.spool_down_time);
            (void)get_json_value(jg, "autofire_cooldown_start", &e.gun.autofire_cooldown_start);
            (void)get_json_value(jg, "autofire_cooldown_min", &e.gun.autofire_cooldown_min);
            (void)get_json_value(jg, "autofire_delay", &e.gun.autofire_delay);
            (void)get_json_value(jg, "tracking_cooldown", &e.gun.tracking_cooldown);
        }

        JsonView js; if (jeng.get_view("stars", js) && js.is_object()) {
            (void)get_json_value(js, "count", &e.star_count);
        }

        JsonView jproj; if (jeng.get_view("projectiles", jproj) && jproj.is_object()) {
            (void)get_json_value(jproj, "capacity", &e.projectile.capacity);
            (void)get_json_rgba(jproj, "tracking_color", &e.projectile.tracking_color);
            (void)get_json_rgba(jproj, "autofire_color", &e.projectile.autofire_color);
        }
    }
};

// Clamp values that would break the loop or the engine back to defaults.
static void apply_floor_defaults(ClientConfig& out)
{
    const ClientConfig def;
    if (out.fps_cap <= 0) out.fps_cap = def.fps_cap;
    if (out.font_base_size <= 0) out.font_base_size = def.font_base_size;
    if (out.hud.line_height <= 0) out.hud.line_height = def.hud.line_height;
    if (out.title.empty()) out.title = def.title;

    EngineConfig& e = out.engine;
    if (e.star_count < 0) e.star_count = 0;
    if (e.projectile.capacity < 0) e.projectile.capacity = 0;
    if (e.gun.spool_up_time <= 0.0) e.gun.spool_up_time = def.engine.gun.spool_up_time;
    if (e.gun.spool_down_time <= 0.0) e.gun.spool_down_time = def.engine.gun.spool_down_time;
    if (e.gun.autofire_cooldown_min > e.gun.autofire_cooldown_start) e.gun.autofire_cooldown_min = e.gun.autofire_cooldown_start;
    if (e.player.top_speed <= 0.0) e.player.top_speed = def.engine.player.top_speed;
    if (e.player.accel <= 0.0) e.player.accel = def.engine.player.accel;
}

static void log_summary(const ClientConfig& out)
{
    DBG("client config: title=%s fps=%d font=%s base=%d hud=(%d,%d)+%d seed=%u stars=%d proj.cap=%d",
        out.title.c_str(), out.fps_cap, out.font_path.empty() ? "<none>" : out.font_path.c_str(),
        out.font_base_size, out.hud.x, out.hud.y, out.hud.line_height,
        out.engine.seed, out.engine.star_count, out.engine.projectile.capacity);
}

bool load_client_config(const char* path, ClientConfig& out, std::string* err)
{
    std::ifstream f(path ? path : "", std::ios::binary);
    if (!f.good()) {
        DBG("no client config at %s; using defaults", path ? path : "<null>");
        apply_floor_defaults(out);
        return true;
    }

    // Initialize model with existing defaults from 'out', then overlay JSON
    ClientConfigModel model; model.cfg = out;
    if (!JsonInterface::load_file(path, model, err)) return false;

    out = model.cfg;
    apply_floor_defaults(out);
    log_summary(out);
    return true;
}

bool parse_client_config(const std::string& text, ClientConfig& out, std::string* err)
{
    ClientConfigModel model; model.cfg = out;
    if (!JsonInterface::load_string(text, model, err)) return false;
    out = model.cfg;
    apply_floor_defaults(out);
    return true;
}
