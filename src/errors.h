// Process exit codes for fatal conditions.
#pragma once

enum ExitCode {
    EXIT_OK = 0,
    LOADING_ERROR = 2,  // configuration file present but unusable
    SDL_ERROR = 3,      // SDL / SDL_ttf / window / renderer failure
    ENGINE_ERROR = 4,   // exception escaped the simulation engine
};
