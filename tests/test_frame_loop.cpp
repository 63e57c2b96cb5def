#include <doctest/doctest.h>

#include "frame_loop.h"
#include "recording_engine.h"
#include "sdl_events.h"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

struct CapturePresenter : public Presenter {
    std::vector<DrawList> frames;
    void present(const DrawList& dl) override { frames.push_back(dl); }
};

struct LoopHarness {
    RecordingEngine engine;
    CapturePresenter out;
    ViewportState vp = make_viewport(800, 600);
    InputStateTracker input;
    FrameLoop loop;

    LoopHarness()
      : input(engine, nullptr, [this]() { return vp.scale_factor; }),
        loop(engine, input, out, vp, RenderStyle(), 60) {}
};

} // namespace

TEST_CASE("FrameLoop: a running tick updates, renders and presents once")
{
    LoopHarness h;
    KeyState keys;
    keys.press(SDL_SCANCODE_D);
    CHECK(h.loop.tick({}, keys.data(), 0.016) == FrameLoop::State::Running);
    CHECK(h.engine.calls == std::vector<std::string>{"send_command(move_right)", "update"});
    REQUIRE(h.engine.updates.size() == 1);
    CHECK(h.engine.updates[0] == doctest::Approx(0.016));
    CHECK(h.out.frames.size() == 1);
    CHECK(h.loop.frames() == 1);
}

TEST_CASE("FrameLoop: quit stops without updating and stays stopped")
{
    LoopHarness h;
    CHECK(h.loop.tick({quit_event()}, nullptr, 0.016) == FrameLoop::State::Stopped);
    CHECK(h.engine.calls.empty());
    CHECK(h.out.frames.empty());

    KeyState keys;
    keys.press(SDL_SCANCODE_W);
    CHECK(h.loop.tick({}, keys.data(), 0.016) == FrameLoop::State::Stopped);
    CHECK(h.engine.calls.empty());
}

TEST_CASE("FrameLoop: negative dt is clamped to zero")
{
    LoopHarness h;
    h.loop.tick({}, nullptr, -1.0);
    REQUIRE(h.engine.updates.size() == 1);
    CHECK(h.engine.updates[0] == 0.0);
}

TEST_CASE("FrameLoop: snapshot is sanitized before rendering")
{
    LoopHarness h;
    h.engine.snapshot.player_rotation = std::numeric_limits<double>::quiet_NaN();
    StarView st;
    st.twinkle = 5.0;
    h.engine.snapshot.stars.push_back(st);
    h.loop.tick({}, nullptr, 0.0);

    REQUIRE(h.out.frames.size() == 1);
    const DrawList& dl = h.out.frames[0];
    CHECK(dl[1].layer == Layer::STARS);
    CHECK(dl[1].color == Rgb{255, 255, 255});
    for (const auto& c : dl)
        for (const auto& p : c.points) {
            CHECK(std::isfinite(p.x));
            CHECK(std::isfinite(p.y));
        }
}

TEST_CASE("FrameLoop: renders with the viewport current at each frame")
{
    LoopHarness h;
    h.engine.snapshot.stars.push_back(StarView{});   // size 2 circle
    h.loop.tick({}, nullptr, 0.0);
    h.vp = make_viewport(1600, 1200);
    h.loop.tick({}, nullptr, 0.0);
    REQUIRE(h.out.frames.size() == 2);
    CHECK(h.out.frames[0][1].radius == 2);
    CHECK(h.out.frames[1][1].radius == 4);
}

TEST_CASE("FrameLoop: engine exceptions propagate")
{
    LoopHarness h;
    h.engine.throw_on_update = true;
    CHECK_THROWS_AS(h.loop.tick({}, nullptr, 0.016), std::runtime_error);
}
