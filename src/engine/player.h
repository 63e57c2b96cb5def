// Player ship: velocity steering toward the input direction plus a
// heading controller that turns the hull toward where it is going.
#pragma once

#include "config.h"
#include "engine_config.h"

class Player {
public:
    // Logical world position and velocity (px, px/s), y down
    double x = 0.0, y = 0.0;
    double vx = 0.0, vy = 0.0;

    // Heading in atan2 convention; -pi/2 is up
    double facing = PHYS_ANGLE_UP;
    double target_facing = PHYS_ANGLE_UP;
    double ang_vel = 0.0;

    // Input direction for this step, normalized by the caller
    double input_dx = 0.0;
    double input_dy = 0.0;

    bool alt_mode = false;      // no drag
    bool boost_mode = false;
    bool control_mode = false;

    explicit Player(const PlayerConfig& cfg) : cfg_(cfg) {}

    double top_speed() const;
    double accel() const;

    // Render heading: 0 = nose up.
    double rotation() const { return facing + M_PI / 2.0; }

    void advance(double dt_seconds);

private:
    void steer_heading(double dt_seconds);

    PlayerConfig cfg_;
};
