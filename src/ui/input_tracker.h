// Translates one tick of SDL events plus the held-key array into engine calls.
//
// Edge-triggered: modifiers (Alt, Shift, Ctrl) and the two fire sources
// (Space, left mouse button) emit one call per transition.
// Level-triggered: movement emits one command per held direction per tick,
// after every event of the tick has been handled.
// Focus loss counts as releasing everything held: latched modes are turned
// off and a held fire source emits its normal release sequence, tracking
// shot included.
#pragma once

#include <SDL.h>

#include <functional>
#include <vector>

#include "game_engine.h"

struct InputState {
    bool move_up = false;
    bool move_down = false;
    bool move_left = false;
    bool move_right = false;

    // Mirror the mode last sent to the engine.
    bool alt = false;
    bool boost = false;
    bool control = false;

    // Shared by both fire sources; the last transition wins.
    bool autofire_active = false;
    bool space_held = false;
    bool mouse_held = false;

    double mouse_x = 0.0;   // logical
    double mouse_y = 0.0;
};

class InputStateTracker {
public:
    enum class TickResult { Continue, Quit };

    using ResizeHandler = std::function<void(int, int)>;
    using ScaleSource = std::function<double()>;

    InputStateTracker(GameEngine& engine, ResizeHandler on_resize, ScaleSource scale);

    // keys is indexed by SDL_Scancode (SDL_GetKeyboardState layout); null
    // means nothing is held. Returns Quit as soon as a quit request is seen;
    // no engine call follows it in that tick.
    TickResult process_tick(const std::vector<SDL_Event>& events, const Uint8* keys);

    const InputState& state() const { return st_; }

private:
    bool handle_event(const SDL_Event& e);   // false = quit
    void handle_key(const SDL_KeyboardEvent& k, bool down);
    void set_mode(bool& flag, bool on, void (GameEngine::*setter)(bool));
    void press_fire(bool& held);
    void release_fire(bool& held);
    void release_all();
    void apply_movement(const Uint8* keys);

    GameEngine& engine_;
    ResizeHandler on_resize_;
    ScaleSource scale_;
    InputState st_;
};
