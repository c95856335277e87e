#ifndef COLOUR_H
#define COLOUR_H

struct colour {
    unsigned char r;
    unsigned char g;
    unsigned char b;
};

bool operator==(const colour& a, const colour& b);
bool operator!=(const colour& a, const colour& b);

colour colourLerp(colour a, colour b, float t);
colour colourGradient(unsigned int iteration, unsigned int maxIterations);

const colour BLACK = colour{ 0, 0, 0 };
const colour WHITE = colour{ 255, 255, 255 };

// Swatches offered by the colour pickers
const unsigned int PALETTE_SIZE = 10;
extern const colour PALETTE[PALETTE_SIZE];
extern const char* const PALETTE_NAMES[PALETTE_SIZE];

// Out of range indices wrap around
colour paletteColour(unsigned int idx);

#endif
