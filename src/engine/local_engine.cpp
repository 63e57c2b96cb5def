#include "local_engine.h"
#include "our_debug.h"

#include <cmath>

static uint32_t pick_seed(uint32_t seed)
{
    if (seed != 0) return seed;
    std::random_device rd;
    return rd();
}

LocalEngine::LocalEngine(const EngineConfig& cfg)
  : cfg_(cfg),
    rng_(pick_seed(cfg.seed)),
    player_(cfg.player),
    left_gun_(PHYS_LEFT_GUN_X, PHYS_LEFT_GUN_Y, cfg.gun, rng_),
    right_gun_(PHYS_RIGHT_GUN_X, PHYS_RIGHT_GUN_Y, cfg.gun, rng_),
    stars_(cfg.star_count, rng_),
    projectiles_(cfg.projectile.capacity)
{
    NOTE("engine", "local engine: %d stars, projectile capacity %d, seed %u",
         cfg.star_count, cfg.projectile.capacity, cfg.seed);
}

void LocalEngine::send_command(const std::string& name)
{
    Command c;
    if (!command_from_name(name, c)) { DBG("ignoring unknown command '%s'", name.c_str()); return; }
    queue_command(c, command_stack_);
}

void LocalEngine::set_mouse_target(double x, double y)
{
    Command c; c.type = Command::Type::MOUSE_TARGET; c.a = x; c.b = y;
    queue_command(c, command_stack_);
}

void LocalEngine::start_autofire()
{
    Command c; c.type = Command::Type::START_AUTOFIRE;
    queue_command(c, command_stack_);
}

void LocalEngine::stop_autofire()
{
    Command c; c.type = Command::Type::STOP_AUTOFIRE;
    queue_command(c, command_stack_);
}

void LocalEngine::start_shooting_tracking()
{
    Command c; c.type = Command::Type::START_TRACKING;
    queue_command(c, command_stack_);
}

void LocalEngine::stop_shooting_tracking()
{
    Command c; c.type = Command::Type::STOP_TRACKING;
    queue_command(c, command_stack_);
}

void LocalEngine::set_alt_mode(bool enabled)
{
    Command c; c.type = Command::Type::ALT_MODE; c.on = enabled;
    queue_command(c, command_stack_);
}

void LocalEngine::set_boost_mode(bool enabled)
{
    Command c; c.type = Command::Type::BOOST_MODE; c.on = enabled;
    queue_command(c, command_stack_);
}

void LocalEngine::set_control_mode(bool enabled)
{
    Command c; c.type = Command::Type::CONTROL_MODE; c.on = enabled;
    queue_command(c, command_stack_);
}

void LocalEngine::apply_commands()
{
    player_.input_dx = 0.0;
    player_.input_dy = 0.0;

    for (const auto& c : command_stack_) {
        switch (c.type) {
            case Command::Type::MOVE_UP:    player_.input_dy = -1.0; break;
            case Command::Type::MOVE_DOWN:  player_.input_dy =  1.0; break;
            case Command::Type::MOVE_LEFT:  player_.input_dx = -1.0; break;
            case Command::Type::MOVE_RIGHT: player_.input_dx =  1.0; break;
            case Command::Type::ALT_MODE:     player_.alt_mode = c.on; break;
            case Command::Type::BOOST_MODE:   player_.boost_mode = c.on; break;
            case Command::Type::CONTROL_MODE: player_.control_mode = c.on; break;
            case Command::Type::MOUSE_TARGET: {
                // Screen target -> world through the current camera.
                double wx = c.a + camera_.x, wy = c.b + camera_.y;
                aim_angle_ = std::atan2(wy - player_.y, wx - player_.x);
                has_aim_ = true;
            } break;
            case Command::Type::START_AUTOFIRE:
                autofiring_ = true;
                autofire_start_time_ = time_;
                break;
            case Command::Type::STOP_AUTOFIRE:
                autofiring_ = false;
                break;
            case Command::Type::START_TRACKING:
                if (!fired_during_hold_) fire_tracking();
                fired_during_hold_ = false;
                break;
            case Command::Type::STOP_TRACKING:
                break;
        }
    }
    command_stack_.clear();

    double mag = std::sqrt(player_.input_dx * player_.input_dx + player_.input_dy * player_.input_dy);
    if (mag > 0.01) {
        player_.input_dx /= mag;
        player_.input_dy /= mag;
    }
}

bool LocalEngine::spawn_from(Gun& gun, Projectile::Kind kind)
{
    const double rot = player_.rotation();
    const double c = std::cos(rot), s = std::sin(rot);
    const double gx = player_.x + gun.offset_x() * c - gun.offset_y() * s;
    const double gy = player_.y + gun.offset_x() * s + gun.offset_y() * c;
    Projectile p = make_projectile(kind, gx, gy, gun.firing_angle(), player_.vx, player_.vy, cfg_.projectile);
    if (!projectiles_.spawn(p)) return false;
    gun.add_recoil(kind == Projectile::Kind::TRACKING ? cfg_.projectile.tracking_recoil_amount
                                                      : cfg_.projectile.autofire_recoil_amount);
    return true;
}

void LocalEngine::fire_tracking()
{
    if (time_ - last_tracking_shot_ < cfg_.gun.tracking_cooldown) return;
    last_tracking_shot_ = time_;

    FireSector sector = fire_sector(aim_angle(), player_.facing);
    if (sector != FireSector::RIGHT) spawn_from(left_gun_, Projectile::Kind::TRACKING);
    if (sector != FireSector::LEFT) spawn_from(right_gun_, Projectile::Kind::TRACKING);
}

void LocalEngine::fire_autofire()
{
    FireSector sector = fire_sector(aim_angle(), player_.facing);
    if (sector != FireSector::RIGHT && left_gun_.update_autofire(time_))
        spawn_from(left_gun_, Projectile::Kind::AUTOFIRE);
    if (sector != FireSector::LEFT && right_gun_.update_autofire(time_))
        spawn_from(right_gun_, Projectile::Kind::AUTOFIRE);
}

void LocalEngine::update(double dt_seconds)
{
    if (!(dt_seconds > 0.0)) dt_seconds = 0.0;

    apply_commands();
    time_ += dt_seconds;

    if (has_aim_) {
        left_gun_.set_target_angle(aim_angle_);
        right_gun_.set_target_angle(aim_angle_);
    }

    // Guns fire from the pre-movement position.
    if (autofiring_) {
        left_gun_.spool_up(dt_seconds);
        right_gun_.spool_up(dt_seconds);
        if (time_ - autofire_start_time_ >= cfg_.gun.autofire_delay) {
            fired_during_hold_ = true;
            fire_autofire();
        }
    }

    left_gun_.update_tracking(player_.rotation(), dt_seconds);
    right_gun_.update_tracking(player_.rotation(), dt_seconds);

    player_.advance(dt_seconds);
    projectiles_.advance(dt_seconds);

    double cdx = 0.0, cdy = 0.0;
    camera_.update(player_.x, player_.y, player_.vx, player_.vy, player_.control_mode, cdx, cdy);
    stars_.update(dt_seconds, cdx, cdy, camera_.x, camera_.y);
}

SceneSnapshot LocalEngine::get_render_data() const
{
    SceneSnapshot snap;
    snap.player_x = player_.x;
    snap.player_y = player_.y;
    snap.player_rotation = player_.rotation();
    snap.player_vx = player_.vx;
    snap.player_vy = player_.vy;
    snap.camera_x = camera_.x;
    snap.camera_y = camera_.y;
    snap.left_gun_angle = left_gun_.angle();
    snap.right_gun_angle = right_gun_.angle();
    snap.left_gun_spool = left_gun_.spool();
    snap.right_gun_spool = right_gun_.spool();

    stars_.append_views(snap.stars);

    snap.projectiles.reserve(projectiles_.size());
    for (const auto& p : projectiles_.items()) {
        ProjectileView v;
        v.x = p.x;
        v.y = p.y;
        v.length = p.length;
        v.width = p.width;
        v.rotation = p.rotation();
        v.color = p.color;
        snap.projectiles.push_back(v);
    }
    return snap;
}
