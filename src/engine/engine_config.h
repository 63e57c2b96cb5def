// Tunables for the local simulation. Defaults match the shipped feel;
// config/client.json "engine" block may override any of them.
#pragma once

#include <cstdint>

#include "scene_snapshot.h"

struct PlayerConfig {
    double top_speed = 400.0;           // px/s
    double accel = 4000.0;              // px/s^2 toward input direction
    double drag = 3.0;                  // 1/s velocity decay with no input
    double boost_multiplier = 2.0;      // top speed and accel while boosting
    double control_speed_scale = 0.5;   // top speed while in control mode
    double ang_accel = 40.0;            // rad/s^2 heading controller
    double ang_vel_max = 8.0;           // rad/s
};

struct GunConfig {
    double rotation_speed = 4.0;             // rad/s
    double arc_degrees = 200.0;              // total traverse around the mount
    double recoil_decay_rate = 2.0;          // per second
    double recoil_random_offset_max = 0.5;   // radians
    double recoil_stack_multiplier = 5.0;
    double recoil_angle_multiplier = 0.2;
    double autofire_cooldown_start = 0.5;    // seconds between shots at spool 0
    double autofire_cooldown_min = 0.1;      // seconds between shots at spool 1
    double spool_up_time = 2.0;              // seconds from 0 to 1
    double spool_down_time = 2.0;            // seconds from 1 to 0
    double autofire_delay = 0.5;             // hold time before autofire shots start
    double tracking_cooldown = 0.5;          // seconds between tracking shots
};

struct ProjectileConfig {
    double tracking_speed = 800.0;
    double tracking_width = 6.0;
    double tracking_length = 12.0;
    double tracking_lifetime = 5.0;
    Rgb tracking_color{100, 150, 255};

    double autofire_speed = 1000.0;
    double autofire_width = 3.0;
    double autofire_length = 6.0;
    double autofire_lifetime = 2.0;
    Rgb autofire_color{255, 200, 50};

    double tracking_recoil_amount = 0.05;
    double autofire_recoil_amount = 0.03;
    int capacity = 100;
};

struct EngineConfig {
    uint32_t seed = 0;      // 0 = seed from std::random_device
    int star_count = 125;
    PlayerConfig player;
    GunConfig gun;
    ProjectileConfig projectile;
};
