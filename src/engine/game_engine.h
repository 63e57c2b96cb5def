// Command/query boundary between the client and a simulation session.
// The client only ever talks to the engine through this class.
#pragma once

#include <string>

#include "scene_snapshot.h"

class GameEngine {
public:
    virtual ~GameEngine() = default;

    // "move_up", "move_down", "move_left" or "move_right"; directional
    // intent for the current tick. Unknown names are ignored.
    virtual void send_command(const std::string& name) = 0;

    // Aim target in logical screen coordinates (camera not applied).
    virtual void set_mouse_target(double x, double y) = 0;

    virtual void start_autofire() = 0;
    virtual void stop_autofire() = 0;

    // Called as a pair, fires one discrete tracking shot.
    virtual void start_shooting_tracking() = 0;
    virtual void stop_shooting_tracking() = 0;

    virtual void set_alt_mode(bool enabled) = 0;      // no drag
    virtual void set_boost_mode(bool enabled) = 0;    // faster acceleration
    virtual void set_control_mode(bool enabled) = 0;  // precision movement

    // Advance the simulation by dt seconds.
    virtual void update(double dt_seconds) = 0;

    virtual SceneSnapshot get_render_data() const = 0;
};
