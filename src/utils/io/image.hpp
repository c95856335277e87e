#ifndef IMAGE_H
#define IMAGE_H

#include <string>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

// Pixels are packed RGBA32, row-major. Returns false and logs on failure.
bool savePixelsAsPNG(const std::vector<unsigned int>& pixels, unsigned int width, unsigned int height, const std::string& filename);

#endif
