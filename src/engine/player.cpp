#include "player.h"
#include "angle_utils.h"

#include <cmath>

double Player::top_speed() const
{
    double v = cfg_.top_speed;
    if (boost_mode) v *= cfg_.boost_multiplier;
    if (control_mode) v *= cfg_.control_speed_scale;
    return v;
}

double Player::accel() const
{
    return boost_mode ? cfg_.accel * cfg_.boost_multiplier : cfg_.accel;
}

void Player::steer_heading(double dt_seconds)
{
    double err = shortest_angle_diff(facing, target_facing);
    if (std::fabs(err) < 1e-6) {
        ang_vel = 0.0;
        facing = target_facing;
        return;
    }
    const double amax = cfg_.ang_accel;
    if (amax <= 0.0) {
        facing = target_facing;
        ang_vel = 0.0;
        return;
    }
    // Brake once the remaining error fits inside the stopping distance.
    double stop_dist = (ang_vel * ang_vel) / (2.0 * amax);
    double acc;
    if (stop_dist >= std::fabs(err)) {
        acc = (ang_vel > 0.0 ? -amax : (ang_vel < 0.0 ? amax : (err > 0.0 ? amax : -amax)));
    } else {
        acc = (err > 0.0) ? amax : -amax;
    }
    double av = ang_vel + acc * dt_seconds;
    const double vmax = cfg_.ang_vel_max;
    if (av >  vmax) av =  vmax;
    if (av < -vmax) av = -vmax;
    double th = facing + av * dt_seconds;
    double new_err = shortest_angle_diff(th, target_facing);
    if ((err > 0 && new_err < 0) || (err < 0 && new_err > 0)) { th = target_facing; av = 0.0; }
    facing = normalize_angle(th);
    ang_vel = av;
}

void
Player::advance(double dt_seconds)
{
    const bool has_input = (input_dx != 0.0 || input_dy != 0.0);
    if (has_input) target_facing = std::atan2(input_dy, input_dx);
    steer_heading(dt_seconds);

    if (has_input) {
        // Accelerate toward input * top_speed, never overshooting it.
        const double tvx = input_dx * top_speed();
        const double tvy = input_dy * top_speed();
        const double dvx = tvx - vx, dvy = tvy - vy;
        const double dv = std::sqrt(dvx*dvx + dvy*dvy);
        const double step = accel() * dt_seconds;
        if (dv <= step) { vx = tvx; vy = tvy; }
        else { vx += dvx / dv * step; vy += dvy / dv * step; }
    } else if (!alt_mode) {
        const double k = std::exp(-cfg_.drag * dt_seconds);
        vx *= k;
        vy *= k;
        if (std::fabs(vx) < 1e-3) vx = 0.0;
        if (std::fabs(vy) < 1e-3) vy = 0.0;
    }

    x += vx * dt_seconds;
    y += vy * dt_seconds;
}
