// In-process simulation behind the GameEngine interface: one player ship
// with two turrets, a follow camera, a parallax starfield and projectiles.
#pragma once

#include <random>
#include <string>
#include <vector>

#include "command.h"
#include "engine_config.h"
#include "follow_camera.h"
#include "game_engine.h"
#include "gun.h"
#include "player.h"
#include "projectile.h"
#include "starfield.h"

class LocalEngine : public GameEngine {
public:
    explicit LocalEngine(const EngineConfig& cfg = EngineConfig());

    void send_command(const std::string& name) override;
    void set_mouse_target(double x, double y) override;
    void start_autofire() override;
    void stop_autofire() override;
    void start_shooting_tracking() override;
    void stop_shooting_tracking() override;
    void set_alt_mode(bool enabled) override;
    void set_boost_mode(bool enabled) override;
    void set_control_mode(bool enabled) override;
    void update(double dt_seconds) override;
    SceneSnapshot get_render_data() const override;

    const Player& player() const { return player_; }
    const Gun& left_gun() const { return left_gun_; }
    const Gun& right_gun() const { return right_gun_; }
    const FollowCamera& camera() const { return camera_; }
    const Starfield& starfield() const { return stars_; }
    const ProjectilePool& projectiles() const { return projectiles_; }
    double time() const { return time_; }
    bool autofiring() const { return autofiring_; }

    // Aim angle from the player, or the hull facing before any mouse input.
    double aim_angle() const { return has_aim_ ? aim_angle_ : player_.facing; }

private:
    void apply_commands();
    void fire_tracking();
    void fire_autofire();
    bool spawn_from(Gun& gun, Projectile::Kind kind);

    EngineConfig cfg_;
    std::mt19937 rng_;

    Player player_;
    Gun left_gun_;
    Gun right_gun_;
    FollowCamera camera_;
    Starfield stars_;
    ProjectilePool projectiles_;

    std::vector<Command> command_stack_;

    double time_ = 0.0;
    bool has_aim_ = false;
    double aim_angle_ = 0.0;

    bool autofiring_ = false;
    double autofire_start_time_ = 0.0;
    bool fired_during_hold_ = false;     // suppresses the tracking shot on release
    double last_tracking_shot_ = -1e9;
};
