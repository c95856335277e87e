#include <algorithm>
#include <cmath>

#include "colour.hpp"

const colour PALETTE[PALETTE_SIZE] = {
    colour{ 255, 255, 255 },
    colour{ 214, 39, 40 },
    colour{ 0, 0, 0 },
    colour{ 31, 119, 180 },
    colour{ 255, 215, 0 },
    colour{ 255, 127, 14 },
    colour{ 128, 128, 128 },
    colour{ 140, 200, 60 },
    colour{ 30, 100, 45 },
    colour{ 20, 24, 64 },
};

const char* const PALETTE_NAMES[PALETTE_SIZE] = {
    "White",
    "Red",
    "Black",
    "Blue",
    "Yellow",
    "Orange",
    "Grey",
    "Light green",
    "Dark green",
    "Navy",
};

// Stops of the inversion-depth gradient
const colour GRADIENT_STOPS[] = {
    colour{ 9, 1, 47 },
    colour{ 4, 4, 73 },
    colour{ 24, 82, 177 },
    colour{ 134, 181, 229 },
    colour{ 241, 233, 191 },
    colour{ 248, 201, 95 },
    colour{ 204, 128, 0 },
    colour{ 106, 52, 3 },
};
const unsigned int GRADIENT_STOP_COUNT = sizeof(GRADIENT_STOPS) / sizeof(GRADIENT_STOPS[0]);

bool operator==(const colour& a, const colour& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

bool operator!=(const colour& a, const colour& b) {
    return !(a == b);
}

colour colourLerp(colour a, colour b, float t) {
    t = std::clamp(t, 0.0f, 1.0f);

    return colour{
        static_cast<unsigned char>(std::lround(a.r + (b.r - a.r) * t)),
        static_cast<unsigned char>(std::lround(a.g + (b.g - a.g) * t)),
        static_cast<unsigned char>(std::lround(a.b + (b.b - a.b) * t)),
    };
}

colour colourGradient(unsigned int iteration, unsigned int maxIterations) {
    if (maxIterations == 0)
        return GRADIENT_STOPS[0];

    // Cycle through the stops a few times over the iteration range
    float t = static_cast<float>(iteration % maxIterations) / maxIterations * 4.0f;
    t -= std::floor(t);

    float scaled = t * (GRADIENT_STOP_COUNT - 1);
    unsigned int idx = std::min(static_cast<unsigned int>(scaled), GRADIENT_STOP_COUNT - 2);

    return colourLerp(GRADIENT_STOPS[idx], GRADIENT_STOPS[idx + 1], scaled - idx);
}

colour paletteColour(unsigned int idx) {
    return PALETTE[idx % PALETTE_SIZE];
}
