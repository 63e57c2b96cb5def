// Camera that eases toward centering the player. Smoothing is a per-step
// lerp factor, stiffer at high speed and stiffest in control mode.
#pragma once

#include <cmath>

#include "config.h"

struct FollowCamera {
    double x = -UI_LOGICAL_W / 2.0;
    double y = -UI_LOGICAL_H / 2.0;

    static double smoothing(double speed, bool control_mode) {
        if (control_mode) return 0.9;
        const double min_speed = 1000.0, max_speed = 10000.0;
        if (speed < min_speed) return 0.4;
        if (speed > max_speed) return 0.8;
        return 0.4 + (speed - min_speed) / (max_speed - min_speed) * 0.4;
    }

    // Moves toward player - (400, 300); returns the movement in dx, dy.
    void update(double px, double py, double vx, double vy, bool control_mode, double& dx, double& dy) {
        const double k = smoothing(std::sqrt(vx*vx + vy*vy), control_mode);
        dx = (px - UI_LOGICAL_W / 2.0 - x) * k;
        dy = (py - UI_LOGICAL_H / 2.0 - y) * k;
        x += dx;
        y += dy;
    }
};
