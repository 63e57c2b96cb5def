#include "gun.h"
#include "angle_utils.h"

#include <algorithm>
#include <cmath>

FireSector fire_sector(double aim_angle, double facing)
{
    double deg = normalize_angle(aim_angle - facing) * 180.0 / M_PI;
    if (std::fabs(deg) <= 15.0 || std::fabs(deg) >= 165.0) return FireSector::BOTH;
    return deg > 0.0 ? FireSector::LEFT : FireSector::RIGHT;
}

Gun::Gun(double offset_x, double offset_y, const GunConfig& cfg, std::mt19937& rng)
  : cfg_(cfg), rng_(rng), offset_x_(offset_x), offset_y_(offset_y)
{
    // Rest direction points away from the hull, turned 45 deg toward the
    // nose so the dead zones sit behind each mount.
    double raw = std::atan2(offset_y, offset_x);
    base_angle_ = normalize_angle(offset_x < 0.0 ? raw + M_PI / 4.0 : raw - M_PI / 4.0);
    arc_half_width_ = cfg_.arc_degrees * 0.5 * M_PI / 180.0;
    angle_ = base_angle_;
    update_arc(0.0);
}

void Gun::update_arc(double ship_rotation)
{
    double center = normalize_angle(base_angle_ + ship_rotation);
    arc_min_ = normalize_angle(center - arc_half_width_);
    arc_max_ = normalize_angle(center + arc_half_width_);
}

bool Gun::is_angle_valid(double angle) const
{
    if (arc_half_width_ >= M_PI) return true;
    if (arc_min_ < arc_max_) return angle >= arc_min_ && angle <= arc_max_;
    return angle >= arc_min_ || angle <= arc_max_;   // arc wraps through +-pi
}

void Gun::rotate_to_nearest_edge()
{
    double to_min = shortest_angle_diff(angle_, arc_min_);
    double to_max = shortest_angle_diff(angle_, arc_max_);
    angle_ = std::fabs(to_min) < std::fabs(to_max) ? arc_min_ : arc_max_;
}

void Gun::rotate_toward(double target, double max_step)
{
    double diff = shortest_angle_diff(angle_, target);
    double candidate = normalize_angle(angle_ + std::max(-max_step, std::min(max_step, diff)));
    if (is_angle_valid(candidate)) {
        angle_ = candidate;
        // Target parked in the dead zone: hold at the closest edge.
        if (std::fabs(shortest_angle_diff(angle_, target)) < 0.01 && !is_angle_valid(target))
            rotate_to_nearest_edge();
    } else {
        // The short way crosses the dead zone; go around the long way.
        double dir = diff > 0.0 ? -1.0 : (diff < 0.0 ? 1.0 : 0.0);
        angle_ = normalize_angle(angle_ + dir * max_step);
        if (!is_angle_valid(angle_)) rotate_to_nearest_edge();
    }
}

void Gun::update_tracking(double ship_rotation, double dt_seconds)
{
    if (recoil_ > 0.0) {
        recoil_ -= cfg_.recoil_decay_rate * dt_seconds;
        if (recoil_ < 0.0) recoil_ = 0.0;
    }

    if (spool_ > 0.0 && !spooling_) {
        spool_ -= dt_seconds / cfg_.spool_down_time;
        if (spool_ < 0.0) spool_ = 0.0;
    }
    spooling_ = false;

    update_arc(ship_rotation);
    if (!has_target_) return;
    rotate_toward(target_angle_, cfg_.rotation_speed * dt_seconds);
}

void Gun::spool_up(double dt_seconds)
{
    spooling_ = true;
    if (spool_ < 1.0) {
        spool_ += dt_seconds / cfg_.spool_up_time;
        if (spool_ > 1.0) spool_ = 1.0;
    }
}

double Gun::autofire_cooldown() const
{
    double range = cfg_.autofire_cooldown_start - cfg_.autofire_cooldown_min;
    return cfg_.autofire_cooldown_start - range * spool_;
}

bool Gun::update_autofire(double now)
{
    // Small epsilon: accumulated frame times land a hair short of the cooldown.
    if (now - last_autofire_time_ + 1e-9 >= autofire_cooldown()) {
        last_autofire_time_ = now;
        return true;
    }
    return false;
}

void Gun::add_recoil(double amount)
{
    std::uniform_real_distribution<double> u(-0.5, 0.5);
    recoil_ += std::fabs(u(rng_) * cfg_.recoil_random_offset_max);
    recoil_ = std::min(recoil_, cfg_.recoil_stack_multiplier * amount);
}

double Gun::firing_angle()
{
    if (recoil_ <= 0.0) return angle_;
    std::uniform_real_distribution<double> u(-0.5, 0.5);
    return angle_ + u(rng_) * recoil_ * cfg_.recoil_angle_multiplier;
}
