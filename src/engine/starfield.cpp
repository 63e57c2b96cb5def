#include "starfield.h"
#include "config.h"

#include <cmath>

double Star::twinkle() const
{
    return brightness * (std::sin(phase) + 1.0) * 0.5;
}

Starfield::Starfield(int count, std::mt19937& rng)
  : rng_(rng)
{
    if (count < 0) count = 0;
    stars_.reserve((size_t)count);
    for (int i = 0; i < count; ++i) {
        double x = uniform(-400.0, 1200.0);
        double y = uniform(-400.0, 1200.0);
        stars_.push_back(random_star(x, y));
    }
}

double Starfield::uniform(double lo, double hi)
{
    std::uniform_real_distribution<double> d(lo, hi);
    return d(rng_);
}

Star Starfield::random_star(double x, double y)
{
    Star s;
    s.x = x;
    s.y = y;
    s.depth = uniform(0.1, 1.0);
    s.shape = (StarShape)std::uniform_int_distribution<int>(0, 2)(rng_);
    s.color = (StarColor)std::uniform_int_distribution<int>(0, 5)(rng_);
    // Mostly small stars, some large ones.
    s.size = std::bernoulli_distribution(0.7)(rng_) ? uniform(0.3, 2.0) : uniform(2.0, 5.0);
    s.brightness = uniform(0.5, 1.0);
    s.phase = uniform(0.0, 2.0 * M_PI);
    s.phase_speed = uniform(0.5, 2.0);
    return s;
}

Star Starfield::random_star_at_edge(double cam_x, double cam_y)
{
    // Stays inside the cull margin so the star is not recycled next step.
    const double W = UI_LOGICAL_W, H = UI_LOGICAL_H;
    const double d = uniform(EDGE_MIN, EDGE_MAX);
    double x, y;
    switch (std::uniform_int_distribution<int>(0, 3)(rng_)) {
        case 0:  x = cam_x + uniform(-100.0, W + 100.0); y = cam_y - d; break;
        case 1:  x = cam_x + uniform(-100.0, W + 100.0); y = cam_y + H + d; break;
        case 2:  x = cam_x - d; y = cam_y + uniform(-100.0, H + 100.0); break;
        default: x = cam_x + W + d; y = cam_y + uniform(-100.0, H + 100.0); break;
    }
    return random_star(x, y);
}

void Starfield::update(double dt_seconds, double cam_dx, double cam_dy, double cam_x, double cam_y)
{
    for (auto& s : stars_) {
        s.x += cam_dx * s.depth * PARALLAX;
        s.y += cam_dy * s.depth * PARALLAX;
        s.phase = std::fmod(s.phase + s.phase_speed * dt_seconds, 2.0 * M_PI);

        double sx = s.x - cam_x, sy = s.y - cam_y;
        if (sx < -CULL_MARGIN || sx > UI_LOGICAL_W + CULL_MARGIN || sy < -CULL_MARGIN || sy > UI_LOGICAL_H + CULL_MARGIN)
            s = random_star_at_edge(cam_x, cam_y);
    }
}

void Starfield::append_views(std::vector<StarView>& out) const
{
    out.reserve(out.size() + stars_.size());
    for (const auto& s : stars_) {
        StarView v;
        v.x = s.x;
        v.y = s.y;
        v.size = s.size;
        v.color = s.color;
        v.shape = s.shape;
        v.twinkle = s.twinkle();
        out.push_back(v);
    }
}
