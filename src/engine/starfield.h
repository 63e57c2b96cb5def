// Decorative parallax stars around the camera. Stars drift with a share of
// the camera motion by depth, twinkle, and respawn past a screen edge once
// they fall too far out of view.
#pragma once

#include <random>
#include <vector>

#include "scene_snapshot.h"

struct Star {
    double x = 0.0, y = 0.0;      // world
    double depth = 0.5;           // 0.1 far .. 1.0 near
    double size = 2.0;
    double brightness = 0.75;     // 0.5 .. 1.0
    double phase = 0.0;           // radians
    double phase_speed = 1.0;     // rad/s
    StarShape shape = StarShape::CIRCLE;
    StarColor color = StarColor::WHITE;

    // brightness * (sin(phase) + 1) / 2, always in [0, brightness]
    double twinkle() const;
};

class Starfield {
public:
    Starfield(int count, std::mt19937& rng);

    // cam_dx/cam_dy: camera movement this step; cam_x/cam_y: camera after it.
    void update(double dt_seconds, double cam_dx, double cam_dy, double cam_x, double cam_y);

    const std::vector<Star>& stars() const { return stars_; }
    void append_views(std::vector<StarView>& out) const;

    static constexpr double PARALLAX = 0.25;
    static constexpr double CULL_MARGIN = 200.0;   // screen px beyond each edge
    static constexpr double EDGE_MIN = 100.0;      // respawn distance past an edge
    static constexpr double EDGE_MAX = 190.0;

private:
    Star random_star(double x, double y);
    Star random_star_at_edge(double cam_x, double cam_y);
    double uniform(double lo, double hi);

    std::mt19937& rng_;
    std::vector<Star> stars_;
};
