// Turret mounted on the player hull. Tracks the aim angle inside a limited
// arc, spools its autofire rate, and carries per-gun recoil jitter.
#pragma once

#include <random>

#include "engine_config.h"

enum class FireSector { LEFT, RIGHT, BOTH };

// Which gun(s) fire for an aim angle relative to the hull facing:
// within +-15 deg of the nose or tail -> both; positive -> left; negative -> right.
FireSector fire_sector(double aim_angle, double facing);

class Gun {
public:
    Gun(double offset_x, double offset_y, const GunConfig& cfg, std::mt19937& rng);

    void set_target_angle(double angle) { target_angle_ = angle; has_target_ = true; }

    // Per-step update: decays recoil, spools down unless spool_up() ran
    // this step, rotates the arc with the ship and turns toward the target.
    void update_tracking(double ship_rotation, double dt_seconds);

    void spool_up(double dt_seconds);

    // True when the spool-dependent cooldown has elapsed; records the shot.
    bool update_autofire(double now);
    double autofire_cooldown() const;

    void add_recoil(double amount);

    // Current angle jittered by accumulated recoil.
    double firing_angle();

    bool is_angle_valid(double angle) const;

    double offset_x() const { return offset_x_; }
    double offset_y() const { return offset_y_; }
    double angle() const { return angle_; }
    double spool() const { return spool_; }
    double recoil() const { return recoil_; }
    double arc_min() const { return arc_min_; }
    double arc_max() const { return arc_max_; }

    // Test hooks
    void set_angle(double a) { angle_ = a; }
    void set_spool(double s) { spool_ = s; }

private:
    void update_arc(double ship_rotation);
    void rotate_to_nearest_edge();
    void rotate_toward(double target, double max_step);

    GunConfig cfg_;
    std::mt19937& rng_;

    double offset_x_, offset_y_;
    double base_angle_;
    double arc_half_width_;
    double arc_min_ = 0.0, arc_max_ = 0.0;

    double angle_;
    double target_angle_ = 0.0;
    bool has_target_ = false;

    double recoil_ = 0.0;
    double last_autofire_time_ = 0.0;
    double spool_ = 0.0;
    bool spooling_ = false;
};
