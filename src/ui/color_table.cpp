#include "color_table.h"

#include <array>
#include <cstddef>

namespace {

struct ColorEntry {
    StarColor tag;
    const char* name;
    Rgb rgb;
};

// Indexed by StarColor; order must match the enum.
const std::array<ColorEntry, 6> kStarColors = {{
    { StarColor::WHITE,        "white",        {255, 255, 255} },
    { StarColor::LIGHT_BLUE,   "light_blue",   {173, 216, 230} },
    { StarColor::CYAN,         "cyan",         {0, 255, 255} },
    { StarColor::LIGHT_PURPLE, "light_purple", {221, 160, 221} },
    { StarColor::PINK,         "pink",         {255, 182, 193} },
    { StarColor::PALE_YELLOW,  "pale_yellow",  {238, 232, 170} },
}};

struct ShapeEntry {
    StarShape tag;
    const char* name;
};

const std::array<ShapeEntry, 3> kStarShapes = {{
    { StarShape::CIRCLE,     "circle" },
    { StarShape::FOUR_POINT, "four_point" },
    { StarShape::SIX_POINT,  "six_point" },
}};

} // namespace

const Rgb& star_color_rgb(StarColor c) { return kStarColors[(size_t)c].rgb; }
const char* star_color_name(StarColor c) { return kStarColors[(size_t)c].name; }
const char* star_shape_name(StarShape s) { return kStarShapes[(size_t)s].name; }

bool star_color_from_name(const std::string& name, StarColor& out)
{
    for (const auto& e : kStarColors) {
        if (name == e.name) { out = e.tag; return true; }
    }
    return false;
}

bool star_shape_from_name(const std::string& name, StarShape& out)
{
    for (const auto& e : kStarShapes) {
        if (name == e.name) { out = e.tag; return true; }
    }
    return false;
}

Rgb twinkled(const Rgb& base, double twinkle)
{
    if (!(twinkle > 0.0)) twinkle = 0.0;
    if (twinkle > 1.0) twinkle = 1.0;
    double m = 0.5 + twinkle * 0.5;
    Rgb out;
    out.r = (uint8_t)(int)(base.r * m);
    out.g = (uint8_t)(int)(base.g * m);
    out.b = (uint8_t)(int)(base.b * m);
    return out;
}
