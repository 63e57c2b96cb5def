#include "frame_loop.h"
#include "our_debug.h"

FrameLoop::FrameLoop(GameEngine& engine, InputStateTracker& input, Presenter& out,
                     const ViewportState& vp, const RenderStyle& style, int fps_cap)
  : engine_(engine), input_(input), out_(out), vp_(vp), style_(style),
    fps_cap_(fps_cap > 0 ? fps_cap : UI_FPS_DEFAULT)
{
}

FrameLoop::State FrameLoop::tick(const std::vector<SDL_Event>& events, const Uint8* keys, double dt)
{
    if (state_ == State::Stopped) return state_;

    if (input_.process_tick(events, keys) == InputStateTracker::TickResult::Quit) {
        state_ = State::Stopped;
        return state_;
    }

    engine_.update(dt < 0.0 ? 0.0 : dt);

    SceneSnapshot snap = engine_.get_render_data();
    int fixed = sanitize_snapshot(snap);
    if (fixed) DBG("snapshot: %d field(s) replaced with defaults", fixed);

    out_.present(render_scene(snap, vp_, style_));
    ++frames_;
    return state_;
}

void FrameLoop::run()
{
    NOTE("ui", "loop start fps_cap=%d", fps_cap_);
    const Uint32 frame_ms = 1000u / (Uint32)fps_cap_;
    Uint32 last_ticks = SDL_GetTicks();
    std::vector<SDL_Event> events;

    while (state_ == State::Running) {
        Uint32 frame_start = SDL_GetTicks();
        double dt = (frame_start - last_ticks) / 1000.0;
        last_ticks = frame_start;

        events.clear();
        SDL_Event e;
        while (SDL_PollEvent(&e)) events.push_back(e);

        tick(events, SDL_GetKeyboardState(nullptr), dt);

        Uint32 spent = SDL_GetTicks() - frame_start;
        if (state_ == State::Running && spent < frame_ms) SDL_Delay(frame_ms - spent);
    }
    NOTE("ui", "loop stop after %llu frames", (unsigned long long)frames_);
}
