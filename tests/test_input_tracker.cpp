#include <doctest/doctest.h>

#include "input_tracker.h"
#include "recording_engine.h"
#include "sdl_events.h"

#include <utility>
#include <vector>

namespace {

struct Harness {
    RecordingEngine engine;
    double scale = 1.0;
    std::vector<std::pair<int, int>> resizes;
    InputStateTracker tracker;

    Harness()
      : tracker(engine,
                [this](int w, int h) { resizes.emplace_back(w, h); },
                [this]() { return scale; }) {}

    InputStateTracker::TickResult tick(const std::vector<SDL_Event>& events, const KeyState& keys) {
        return tracker.process_tick(events, keys.data());
    }
    InputStateTracker::TickResult tick(const std::vector<SDL_Event>& events) {
        KeyState none;
        return tick(events, none);
    }
};

} // namespace

TEST_CASE("InputStateTracker: held up key issues one move_up per tick")
{
    Harness h;
    KeyState keys;
    keys.press(SDL_SCANCODE_W);
    for (int i = 0; i < 3; ++i) CHECK(h.tick({}, keys) == InputStateTracker::TickResult::Continue);
    CHECK(h.engine.calls == std::vector<std::string>{
        "send_command(move_up)", "send_command(move_up)", "send_command(move_up)"});
}

TEST_CASE("InputStateTracker: arrows and WASD map to the same direction, one command each")
{
    Harness h;
    KeyState keys;
    keys.press(SDL_SCANCODE_UP);
    keys.press(SDL_SCANCODE_W);
    keys.press(SDL_SCANCODE_RIGHT);
    keys.press(SDL_SCANCODE_A);
    h.tick({}, keys);
    CHECK(h.engine.calls == std::vector<std::string>{
        "send_command(move_up)", "send_command(move_left)", "send_command(move_right)"});
    CHECK(h.tracker.state().move_up);
    CHECK_FALSE(h.tracker.state().move_down);
}

TEST_CASE("InputStateTracker: movement follows events and uses up, down, left, right order")
{
    Harness h;
    KeyState keys;
    keys.press(SDL_SCANCODE_D);
    keys.press(SDL_SCANCODE_S);
    keys.press(SDL_SCANCODE_LEFT);
    keys.press(SDL_SCANCODE_UP);
    h.tick({mouse_motion(10, 20)}, keys);
    CHECK(h.engine.calls == std::vector<std::string>{
        "set_mouse_target(10,20)",
        "send_command(move_up)", "send_command(move_down)",
        "send_command(move_left)", "send_command(move_right)"});
}

TEST_CASE("InputStateTracker: key repeat never issues movement")
{
    Harness h;
    h.tick({key_down(SDL_SCANCODE_W, true), key_down(SDL_SCANCODE_W, true)});
    CHECK(h.engine.calls.empty());
}

TEST_CASE("InputStateTracker: space press and release in one tick")
{
    Harness h;
    h.tick({key_down(SDL_SCANCODE_SPACE), key_up(SDL_SCANCODE_SPACE)});
    CHECK(h.engine.calls == std::vector<std::string>{
        "start_autofire", "stop_autofire", "start_shooting_tracking", "stop_shooting_tracking"});
    CHECK_FALSE(h.tracker.state().autofire_active);
}

TEST_CASE("InputStateTracker: held space starts autofire once")
{
    Harness h;
    h.tick({key_down(SDL_SCANCODE_SPACE)});
    h.tick({key_down(SDL_SCANCODE_SPACE, true)});
    h.tick({key_down(SDL_SCANCODE_SPACE, true)});
    CHECK(h.engine.calls == std::vector<std::string>{"start_autofire"});
    CHECK(h.tracker.state().autofire_active);
    CHECK(h.tracker.state().space_held);
}

TEST_CASE("InputStateTracker: release without a press issues nothing")
{
    Harness h;
    h.tick({key_up(SDL_SCANCODE_SPACE), mouse_button(SDL_MOUSEBUTTONUP, SDL_BUTTON_LEFT)});
    CHECK(h.engine.calls.empty());
}

TEST_CASE("InputStateTracker: left mouse button fires like space; other buttons do not")
{
    Harness h;
    h.tick({mouse_button(SDL_MOUSEBUTTONDOWN, SDL_BUTTON_RIGHT), mouse_button(SDL_MOUSEBUTTONUP, SDL_BUTTON_RIGHT)});
    CHECK(h.engine.calls.empty());

    h.tick({mouse_button(SDL_MOUSEBUTTONDOWN, SDL_BUTTON_LEFT)});
    h.tick({mouse_button(SDL_MOUSEBUTTONUP, SDL_BUTTON_LEFT)});
    CHECK(h.engine.calls == std::vector<std::string>{
        "start_autofire", "stop_autofire", "start_shooting_tracking", "stop_shooting_tracking"});
}

TEST_CASE("InputStateTracker: both fire sources share the autofire flag")
{
    Harness h;
    h.tick({key_down(SDL_SCANCODE_SPACE), mouse_button(SDL_MOUSEBUTTONDOWN, SDL_BUTTON_LEFT)});
    CHECK(h.engine.count("start_autofire") == 2);

    // Releasing one source clears the flag even though the other is still held.
    h.tick({mouse_button(SDL_MOUSEBUTTONUP, SDL_BUTTON_LEFT)});
    CHECK_FALSE(h.tracker.state().autofire_active);
    CHECK(h.tracker.state().space_held);
    CHECK(h.engine.count("stop_autofire") == 1);

    h.tick({key_up(SDL_SCANCODE_SPACE)});
    CHECK(h.engine.count("stop_autofire") == 2);
    CHECK(h.engine.count("start_shooting_tracking") == 2);
}

TEST_CASE("InputStateTracker: modifiers are edge-triggered")
{
    Harness h;
    h.tick({key_down(SDL_SCANCODE_LSHIFT), key_down(SDL_SCANCODE_LSHIFT, true), key_down(SDL_SCANCODE_RSHIFT)});
    CHECK(h.engine.calls == std::vector<std::string>{"set_boost_mode(true)"});
    CHECK(h.tracker.state().boost);

    h.tick({key_up(SDL_SCANCODE_LSHIFT), key_up(SDL_SCANCODE_RSHIFT)});
    CHECK(h.engine.calls == std::vector<std::string>{"set_boost_mode(true)", "set_boost_mode(false)"});
    CHECK_FALSE(h.tracker.state().boost);
}

TEST_CASE("InputStateTracker: alt, shift and ctrl map to their modes")
{
    Harness h;
    h.tick({key_down(SDL_SCANCODE_RALT), key_down(SDL_SCANCODE_LSHIFT), key_down(SDL_SCANCODE_RCTRL)});
    h.tick({key_up(SDL_SCANCODE_RCTRL), key_up(SDL_SCANCODE_RALT)});
    CHECK(h.engine.calls == std::vector<std::string>{
        "set_alt_mode(true)", "set_boost_mode(true)", "set_control_mode(true)",
        "set_control_mode(false)", "set_alt_mode(false)"});
}

TEST_CASE("InputStateTracker: mouse motion is divided by the scale factor")
{
    Harness h;
    h.scale = 2.0;
    h.tick({mouse_motion(400, 300)});
    CHECK(h.engine.calls == std::vector<std::string>{"set_mouse_target(200,150)"});
    CHECK(h.tracker.state().mouse_x == doctest::Approx(200.0));
    CHECK(h.tracker.state().mouse_y == doctest::Approx(150.0));
}

TEST_CASE("InputStateTracker: every motion event is forwarded")
{
    Harness h;
    h.tick({mouse_motion(1, 1), mouse_motion(2, 2), mouse_motion(3, 3)});
    CHECK(h.engine.calls.size() == 3);
}

TEST_CASE("InputStateTracker: quit stops the tick before any further call")
{
    Harness h;
    KeyState keys;
    keys.press(SDL_SCANCODE_W);
    auto r = h.tick({key_down(SDL_SCANCODE_LSHIFT), quit_event(), key_down(SDL_SCANCODE_SPACE)}, keys);
    CHECK(r == InputStateTracker::TickResult::Quit);
    CHECK(h.engine.calls == std::vector<std::string>{"set_boost_mode(true)"});
}

TEST_CASE("InputStateTracker: escape quits")
{
    Harness h;
    KeyState keys;
    keys.press(SDL_SCANCODE_W);
    CHECK(h.tick({key_down(SDL_SCANCODE_ESCAPE)}, keys) == InputStateTracker::TickResult::Quit);
    CHECK(h.engine.calls.empty());
}

TEST_CASE("InputStateTracker: resize is delegated and leaves input state alone")
{
    Harness h;
    h.tick({window_event(SDL_WINDOWEVENT_RESIZED, 1000, 500)});
    REQUIRE(h.resizes.size() == 1);
    CHECK(h.resizes[0] == std::make_pair(1000, 500));
    CHECK(h.engine.calls.empty());
}

TEST_CASE("InputStateTracker: focus loss releases latched modes and fire sources")
{
    Harness h;
    h.tick({key_down(SDL_SCANCODE_LALT), key_down(SDL_SCANCODE_LCTRL), key_down(SDL_SCANCODE_SPACE)});
    h.engine.calls.clear();

    h.tick({window_event(SDL_WINDOWEVENT_FOCUS_LOST)});
    CHECK(h.engine.calls == std::vector<std::string>{
        "set_alt_mode(false)", "set_control_mode(false)",
        "stop_autofire", "start_shooting_tracking", "stop_shooting_tracking"});

    // The key-up arriving later is a no-op.
    h.engine.calls.clear();
    h.tick({key_up(SDL_SCANCODE_LALT), key_up(SDL_SCANCODE_SPACE)});
    CHECK(h.engine.calls.empty());
}

TEST_CASE("InputStateTracker: focus loss with the mouse held fires one release sequence")
{
    Harness h;
    h.tick({mouse_button(SDL_MOUSEBUTTONDOWN, SDL_BUTTON_LEFT)});
    CHECK(h.engine.count("start_autofire") == 1);
    h.engine.calls.clear();

    h.tick({window_event(SDL_WINDOWEVENT_FOCUS_LOST)});
    CHECK(h.engine.calls == std::vector<std::string>{
        "stop_autofire", "start_shooting_tracking", "stop_shooting_tracking"});
    CHECK_FALSE(h.tracker.state().mouse_held);
    CHECK_FALSE(h.tracker.state().autofire_active);

    h.engine.calls.clear();
    h.tick({mouse_button(SDL_MOUSEBUTTONUP, SDL_BUTTON_LEFT)});
    CHECK(h.engine.calls.empty());
}
