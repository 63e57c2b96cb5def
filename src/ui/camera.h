#pragma once

#include <cmath>

// Logical-to-device mapping for one frame. The camera offset is the
// logical position of the view's top-left corner; angles are never scaled.
struct Camera {
    double scale = 1.0;  // device pixels per logical pixel
    double cx = 0.0;     // camera offset x (logical)
    double cy = 0.0;     // camera offset y (logical, y down)
};

static inline void world_to_screen(const Camera& cam, double wx, double wy, double& sx, double& sy) {
    sx = wx * cam.scale - cam.cx * cam.scale;
    sy = wy * cam.scale - cam.cy * cam.scale;
}

// Integer variant; truncates toward zero like the star and ship anchors expect.
static inline void world_to_screen(const Camera& cam, double wx, double wy, int& sx, int& sy) {
    double fx, fy; world_to_screen(cam, wx, wy, fx, fy);
    sx = (int)fx;
    sy = (int)fy;
}

// Device pixel -> logical screen position (camera not applied; the engine adds it).
static inline void device_to_logical(const Camera& cam, double px, double py, double& lx, double& ly) {
    lx = px / cam.scale;
    ly = py / cam.scale;
}
