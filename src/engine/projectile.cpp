#include "projectile.h"

#include <algorithm>
#include <cmath>

double Projectile::rotation() const
{
    if (std::fabs(vx) < 0.01 && std::fabs(vy) < 0.01) return 0.0;
    return std::atan2(vy, vx);
}

Projectile make_projectile(Projectile::Kind kind, double x, double y, double angle,
                           double ship_vx, double ship_vy, const ProjectileConfig& cfg)
{
    Projectile p;
    p.kind = kind;
    p.x = x;
    p.y = y;
    double speed;
    if (kind == Projectile::Kind::TRACKING) {
        speed = cfg.tracking_speed;
        p.width = cfg.tracking_width;
        p.length = cfg.tracking_length;
        p.lifetime = cfg.tracking_lifetime;
        p.color = cfg.tracking_color;
    } else {
        speed = cfg.autofire_speed;
        p.width = cfg.autofire_width;
        p.length = cfg.autofire_length;
        p.lifetime = cfg.autofire_lifetime;
        p.color = cfg.autofire_color;
    }
    p.vx = std::cos(angle) * speed + ship_vx;
    p.vy = std::sin(angle) * speed + ship_vy;
    return p;
}

bool ProjectilePool::spawn(const Projectile& p)
{
    if (items_.size() >= capacity_) return false;
    items_.push_back(p);
    return true;
}

void ProjectilePool::advance(double dt_seconds)
{
    for (auto& p : items_) p.advance(dt_seconds);
    items_.erase(std::remove_if(items_.begin(), items_.end(),
                                [](const Projectile& p) { return p.expired(); }),
                 items_.end());
}
