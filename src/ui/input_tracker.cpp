#include "input_tracker.h"
#include "camera.h"
#include "our_debug.h"

#include <utility>

InputStateTracker::InputStateTracker(GameEngine& engine, ResizeHandler on_resize, ScaleSource scale)
  : engine_(engine), on_resize_(std::move(on_resize)), scale_(std::move(scale))
{
}

InputStateTracker::TickResult
InputStateTracker::process_tick(const std::vector<SDL_Event>& events, const Uint8* keys)
{
    for (const auto& e : events) {
        if (!handle_event(e)) return TickResult::Quit;
    }
    apply_movement(keys);
    return TickResult::Continue;
}

bool InputStateTracker::handle_event(const SDL_Event& e)
{
    switch (e.type) {
        case SDL_QUIT:
            return false;

        case SDL_KEYDOWN:
            if (e.key.keysym.scancode == SDL_SCANCODE_ESCAPE && !e.key.repeat) return false;
            handle_key(e.key, true);
            break;

        case SDL_KEYUP:
            handle_key(e.key, false);
            break;

        case SDL_MOUSEBUTTONDOWN:
            if (e.button.button == SDL_BUTTON_LEFT) press_fire(st_.mouse_held);
            break;

        case SDL_MOUSEBUTTONUP:
            if (e.button.button == SDL_BUTTON_LEFT) release_fire(st_.mouse_held);
            break;

        case SDL_MOUSEMOTION: {
            Camera cam;
            cam.scale = scale_ ? scale_() : 1.0;
            if (!(cam.scale > 0.0)) cam.scale = 1.0;
            device_to_logical(cam, e.motion.x, e.motion.y, st_.mouse_x, st_.mouse_y);
            engine_.set_mouse_target(st_.mouse_x, st_.mouse_y);
        } break;

        case SDL_WINDOWEVENT:
            switch (e.window.event) {
                case SDL_WINDOWEVENT_RESIZED:
                case SDL_WINDOWEVENT_SIZE_CHANGED:
                    if (on_resize_) on_resize_(e.window.data1, e.window.data2);
                    break;
                case SDL_WINDOWEVENT_FOCUS_LOST:
                    release_all();
                    break;
                default:
                    break;
            }
            break;

        default:
            break;
    }
    return true;
}

void InputStateTracker::handle_key(const SDL_KeyboardEvent& k, bool down)
{
    switch (k.keysym.scancode) {
        case SDL_SCANCODE_LALT:
        case SDL_SCANCODE_RALT:
            set_mode(st_.alt, down, &GameEngine::set_alt_mode);
            break;
        case SDL_SCANCODE_LSHIFT:
        case SDL_SCANCODE_RSHIFT:
            set_mode(st_.boost, down, &GameEngine::set_boost_mode);
            break;
        case SDL_SCANCODE_LCTRL:
        case SDL_SCANCODE_RCTRL:
            set_mode(st_.control, down, &GameEngine::set_control_mode);
            break;
        case SDL_SCANCODE_SPACE:
            if (down) { if (!k.repeat) press_fire(st_.space_held); }
            else release_fire(st_.space_held);
            break;
        default:
            break;
    }
}

void InputStateTracker::set_mode(bool& flag, bool on, void (GameEngine::*setter)(bool))
{
    if (flag == on) return;
    flag = on;
    (engine_.*setter)(on);
}

void InputStateTracker::press_fire(bool& held)
{
    if (held) return;
    held = true;
    st_.autofire_active = true;
    engine_.start_autofire();
}

void InputStateTracker::release_fire(bool& held)
{
    if (!held) return;
    held = false;
    st_.autofire_active = false;
    engine_.stop_autofire();
    engine_.start_shooting_tracking();
    engine_.stop_shooting_tracking();
}

void InputStateTracker::release_all()
{
    DBG("focus lost: releasing alt=%d boost=%d control=%d space=%d mouse=%d",
        (int)st_.alt, (int)st_.boost, (int)st_.control, (int)st_.space_held, (int)st_.mouse_held);
    set_mode(st_.alt, false, &GameEngine::set_alt_mode);
    set_mode(st_.boost, false, &GameEngine::set_boost_mode);
    set_mode(st_.control, false, &GameEngine::set_control_mode);
    release_fire(st_.space_held);
    release_fire(st_.mouse_held);
}

void InputStateTracker::apply_movement(const Uint8* keys)
{
    st_.move_up = keys && (keys[SDL_SCANCODE_W] || keys[SDL_SCANCODE_UP]);
    st_.move_down = keys && (keys[SDL_SCANCODE_S] || keys[SDL_SCANCODE_DOWN]);
    st_.move_left = keys && (keys[SDL_SCANCODE_A] || keys[SDL_SCANCODE_LEFT]);
    st_.move_right = keys && (keys[SDL_SCANCODE_D] || keys[SDL_SCANCODE_RIGHT]);

    if (st_.move_up) engine_.send_command("move_up");
    if (st_.move_down) engine_.send_command("move_down");
    if (st_.move_left) engine_.send_command("move_left");
    if (st_.move_right) engine_.send_command("move_right");
}
