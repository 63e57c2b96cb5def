// One client frame: input -> engine step -> snapshot -> draw list -> present.
#pragma once

#include <SDL.h>

#include <cstdint>
#include <vector>

#include "game_engine.h"
#include "input_tracker.h"
#include "scene_renderer.h"
#include "sdl_painter.h"
#include "viewport.h"

class FrameLoop {
public:
    enum class State { Running, Stopped };

    // vp is read every frame; it must outlive the loop (ViewportScaler::state()).
    FrameLoop(GameEngine& engine, InputStateTracker& input, Presenter& out,
              const ViewportState& vp, const RenderStyle& style, int fps_cap);

    // Runs a single iteration with already-collected events. Once Stopped,
    // further calls do nothing. Engine exceptions propagate.
    State tick(const std::vector<SDL_Event>& events, const Uint8* keys, double dt);

    // Polls SDL, measures dt with SDL_GetTicks and caps the cadence with
    // SDL_Delay until the tracker reports Quit.
    void run();

    State state() const { return state_; }
    uint64_t frames() const { return frames_; }

private:
    GameEngine& engine_;
    InputStateTracker& input_;
    Presenter& out_;
    const ViewportState& vp_;
    RenderStyle style_;
    int fps_cap_;

    State state_ = State::Running;
    uint64_t frames_ = 0;
};
