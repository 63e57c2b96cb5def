// Straight-flying shots with a fixed lifetime, kept in a bounded pool.
#pragma once

#include <cstddef>
#include <vector>

#include "engine_config.h"
#include "scene_snapshot.h"

struct Projectile {
    enum class Kind { TRACKING, AUTOFIRE } kind = Kind::AUTOFIRE;
    double x = 0.0, y = 0.0;
    double vx = 0.0, vy = 0.0;
    double width = 0.0;
    double length = 0.0;
    double age = 0.0;
    double lifetime = 0.0;
    Rgb color;

    void advance(double dt_seconds) { x += vx * dt_seconds; y += vy * dt_seconds; age += dt_seconds; }
    bool expired() const { return age >= lifetime; }

    // Flight direction; 0 when (nearly) at rest.
    double rotation() const;
};

// Builds a shot leaving (x, y) along 'angle', inheriting the shooter's velocity.
Projectile make_projectile(Projectile::Kind kind, double x, double y, double angle,
                           double ship_vx, double ship_vy, const ProjectileConfig& cfg);

class ProjectilePool {
public:
    explicit ProjectilePool(int capacity) : capacity_(capacity > 0 ? (size_t)capacity : 0) {}

    // False when the pool is full; the shot is dropped.
    bool spawn(const Projectile& p);

    // Advances every shot and removes the expired ones.
    void advance(double dt_seconds);

    const std::vector<Projectile>& items() const { return items_; }
    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::vector<Projectile> items_;
};
