#ifndef RENDER_OPTIONS_H
#define RENDER_OPTIONS_H

#include <string>

#include <SDL2/SDL.h>

struct resolutionOption {
    std::string name;
    float lengthScaleFactor;
};

struct modelOption {
    unsigned int modelIdx;
    SDL_Keycode key;
};

#endif
