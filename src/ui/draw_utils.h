#pragma once
#include <SDL.h>
#include <algorithm>
#include <cmath>
#include <vector>

#include "draw_list.h"

static inline void draw_circle_filled(SDL_Renderer* r, int cx, int cy, int radius) {
    for (int dy = -radius; dy <= radius; ++dy) {
        int y = cy + dy;
        int dx = (int)std::floor(std::sqrt((double)(radius*radius - dy*dy)));
        int x1 = cx - dx;
        int x2 = cx + dx;
        SDL_RenderDrawLine(r, x1, y, x2, y);
    }
}

// Even-odd scanline fill, sampled at pixel centers. Works for the concave
// star outlines as well as the ship triangle.
static inline void fill_polygon(SDL_Renderer* r, const std::vector<Vec2>& pts) {
    const size_t n = pts.size();
    if (n < 3) return;
    double ymin = pts[0].y, ymax = pts[0].y;
    for (const auto& p : pts) { ymin = std::min(ymin, p.y); ymax = std::max(ymax, p.y); }

    std::vector<double> xs;
    xs.reserve(n);
    for (int y = (int)std::floor(ymin); y <= (int)std::ceil(ymax); ++y) {
        double sy = (double)y + 0.5;
        xs.clear();
        for (size_t i = 0; i < n; ++i) {
            const Vec2& a = pts[i];
            const Vec2& b = pts[(i + 1) % n];
            if ((a.y <= sy && b.y > sy) || (b.y <= sy && a.y > sy)) {
                double t = (sy - a.y) / (b.y - a.y);
                xs.push_back(a.x + t * (b.x - a.x));
            }
        }
        std::sort(xs.begin(), xs.end());
        for (size_t i = 0; i + 1 < xs.size(); i += 2) {
            int x1 = (int)std::lround(xs[i]);
            int x2 = (int)std::lround(xs[i + 1]) - 1;
            if (x2 >= x1) SDL_RenderDrawLine(r, x1, y, x2, y);
        }
    }
}

// Line of the given device width. Width 1 maps straight onto SDL; wider
// strokes are filled as a quad around the segment.
static inline void draw_thick_line(SDL_Renderer* r, double x1, double y1, double x2, double y2, int width) {
    if (width <= 1) {
        SDL_RenderDrawLine(r, (int)std::lround(x1), (int)std::lround(y1), (int)std::lround(x2), (int)std::lround(y2));
        return;
    }
    double dx = x2 - x1, dy = y2 - y1;
    double len = std::sqrt(dx*dx + dy*dy);
    if (len < 1e-9) {
        draw_circle_filled(r, (int)std::lround(x1), (int)std::lround(y1), width / 2);
        return;
    }
    double hw = (double)width * 0.5;
    double nx = -dy / len * hw, ny = dx / len * hw;
    std::vector<Vec2> quad = {
        {x1 + nx, y1 + ny}, {x2 + nx, y2 + ny},
        {x2 - nx, y2 - ny}, {x1 - nx, y1 - ny},
    };
    fill_polygon(r, quad);
}

static inline void draw_polygon_outline(SDL_Renderer* r, const std::vector<Vec2>& pts, int width) {
    const size_t n = pts.size();
    if (n < 2) return;
    for (size_t i = 0; i < n; ++i) {
        const Vec2& a = pts[i];
        const Vec2& b = pts[(i + 1) % n];
        draw_thick_line(r, a.x, a.y, b.x, b.y, width);
    }
}
