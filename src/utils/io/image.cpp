#include "./image.hpp"

bool savePixelsAsPNG(const std::vector<unsigned int>& pixels, unsigned int width, unsigned int height, const std::string& filename) {
    if (width == 0 || height == 0 || pixels.size() < static_cast<size_t>(width) * height) {
        SDL_LogError(SDL_LOG_CATEGORY_ERROR, "No finished render to save");
        return false;
    }

    // The surface borrows the buffer, IMG_SavePNG only reads it
    void* data = const_cast<unsigned int*>(pixels.data());
    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormatFrom(data, width, height, 32, width * sizeof(unsigned int), SDL_PIXELFORMAT_RGBA32);
    if (surface == nullptr) {
        SDL_LogError(SDL_LOG_CATEGORY_ERROR, "Failed to create surface: %s", SDL_GetError());
        return false;
    }

    bool saved = true;
    if (IMG_SavePNG(surface, filename.c_str()) < 0) {
        SDL_LogError(SDL_LOG_CATEGORY_ERROR, "Failed to save PNG: %s", SDL_GetError());
        saved = false;
    }

    SDL_FreeSurface(surface);
    return saved;
}
