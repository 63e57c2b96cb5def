// Read-only star palette and tag names.
#pragma once

#include <string>

#include "scene_snapshot.h"

// Base RGB for a star color tag. Total over the enum.
const Rgb& star_color_rgb(StarColor c);

// "white", "light_blue", ... and "circle", "four_point", "six_point".
const char* star_color_name(StarColor c);
const char* star_shape_name(StarShape s);

// Reverse lookups; return false for unknown tags and leave out untouched.
bool star_color_from_name(const std::string& name, StarColor& out);
bool star_shape_from_name(const std::string& name, StarShape& out);

// Brightness multiplier applied to each channel: 0.5 + 0.5 * twinkle.
Rgb twinkled(const Rgb& base, double twinkle);
