// Device-space draw commands produced by the scene renderer.
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "scene_snapshot.h"

struct Vec2 {
    double x = 0.0;
    double y = 0.0;
};

// Which pass of the frame emitted a command; passes are strictly ordered.
enum class Layer { BACKGROUND, STARS, GUNS, SHIP, PROJECTILES, HUD };

struct DrawCmd {
    enum class Kind { CLEAR, FILL_CIRCLE, FILL_POLYGON, OUTLINE_POLYGON, LINE, TEXT } kind = Kind::CLEAR;
    Layer layer = Layer::BACKGROUND;
    Rgb color;
    uint8_t alpha = 255;
    // FILL_CIRCLE: center. *_POLYGON: vertices. LINE: two endpoints. TEXT: top-left.
    std::vector<Vec2> points;
    int radius = 0;        // FILL_CIRCLE
    int width = 1;         // LINE / OUTLINE_POLYGON stroke
    std::string text;      // TEXT
};

using DrawList = std::vector<DrawCmd>;
