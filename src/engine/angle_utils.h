#pragma once

#include <cmath>

#include "config.h"

// Wrap to [-pi, pi].
inline double normalize_angle(double a) {
    while (a >  M_PI) a -= 2.0 * M_PI;
    while (a < -M_PI) a += 2.0 * M_PI;
    return a;
}

// Signed shortest turn from 'from' to 'to'.
inline double shortest_angle_diff(double from, double to) {
    return normalize_angle(to - from);
}
