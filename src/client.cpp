// starlance: windowed client. Reads config/client.json, opens an aspect-locked
// window and drives the local engine through the frame loop until quit.

#include <SDL.h>
#include <SDL_image.h>
#include <SDL_ttf.h>

#include <exception>
#include <string>

#include "errors.h"
#include "our_debug.h"
#include "file_io/config_loader.h"
#include "engine/local_engine.h"
#include "ui/frame_loop.h"
#include "ui/input_tracker.h"
#include "ui/scene_renderer.h"
#include "ui/sdl_painter.h"
#include "ui/viewport.h"

static const char* kConfigPath = "config/client.json";

// Runs the session once SDL, TTF and IMG are up. Returns the process exit code.
static int run_session(const ClientConfig& cfg)
{
    ViewportScaler viewport;
    std::string err;
    if (!viewport.open(cfg, &err)) {
        ERROR("%s", err.c_str());
        return SDL_ERROR;
    }

    try {
        LocalEngine engine(cfg.engine);
        InputStateTracker input(
            engine,
            [&viewport](int w, int h) {
                std::string rerr;
                if (!viewport.handle_resize(w, h, &rerr)) CRASH(SDL_ERROR, "resize failed: %s", rerr.c_str());
            },
            [&viewport]() { return viewport.scale(); });
        SdlPainter painter(viewport);
        FrameLoop loop(engine, input, painter, viewport.state(), render_style_from(cfg), cfg.fps_cap);
        loop.run();
    } catch (const std::exception& ex) {
        ERROR("engine failure: %s", ex.what());
        return ENGINE_ERROR;
    }
    return EXIT_OK;
}

int main(int argc, char** argv)
{
    (void)argc; (void)argv;

    ClientConfig cfg;
    std::string err;
    if (!load_client_config(kConfigPath, cfg, &err)) CRASH(LOADING_ERROR, "config: %s", err.c_str());

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) CRASH(SDL_ERROR, "SDL_Init: %s", SDL_GetError());
    if (TTF_Init() != 0) {
        ERROR("TTF_Init: %s", TTF_GetError());
        SDL_Quit();
        return SDL_ERROR;
    }
    // PNG icons only; a missing codec just leaves the default icon.
    if ((IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG) == 0) DBG("IMG_Init: %s", IMG_GetError());

    int rc = run_session(cfg);

    IMG_Quit();
    TTF_Quit();
    SDL_Quit();
    return rc;
}
