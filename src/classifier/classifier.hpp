#ifndef CLASSIFIER_H
#define CLASSIFIER_H

#include "../colour/colour.hpp"
#include "../complex/complex.hpp"
#include "../settings/settings.hpp"
#include "../tiling/tiling.hpp"

// Read-only state shared by every sample of a frame
struct frameSnapshot {
    tilingDescriptor descriptor;
    tilingSettings settings;
    Complex panOffset;  // disk point the tiling's centre is moved to
};

struct reductionResult {
    Complex z;
    unsigned int reflections;  // all mirror operations, inversions included
    unsigned int inversions;   // in the inversion circle only
    unsigned int iterations;
    bool converged;            // false when the budget ran out; z is then the last state
};

enum class tileFeature {
    Background,
    Ornament,
    Vertex,
    Edge,
    Snake,
    Polygon,
};

struct classification {
    tileFeature feature;
    colour col;
};

// Snake ring cells in pattern order
const colour SNAKE_COLOURS[4] = {
    colour{ 0, 0, 0 },
    colour{ 0, 70, 200 },
    colour{ 255, 255, 255 },
    colour{ 235, 200, 0 },
};

const float PARITY_SHADE = 0.35f;

// Screen pixel position to view coordinates, the shorter side spanning [-1, 1]
Complex screenToView(double px, double py, double width, double height);

// Disk automorphism moving offset to the origin
Complex recentre(const Complex& z, const Complex& offset);

reductionResult reduceToFundamentalDomain(Complex z, const tilingDescriptor& desc, unsigned int maxIterations);

bool inOrnament(const Complex& z, const tilingDescriptor& desc);
bool inVertexCircle(const Complex& z, const tilingDescriptor& desc, const tilingSettings& settings);
bool onEdge(const Complex& z, const tilingDescriptor& desc, const tilingSettings& settings);
colour snakeColour(const Complex& z, bool oddParity, const tilingDescriptor& desc, const tilingSettings& settings);

classification classifyPoint(const Complex& viewPos, const frameSnapshot& frame);

// Average of an nSamples x nSamples grid inside the pixel
colour shadePixel(unsigned int px, unsigned int py, unsigned int width, unsigned int height, const frameSnapshot& frame);
colour shadePixel(unsigned int px, unsigned int py, unsigned int width, unsigned int height, const frameSnapshot& frame, unsigned int nSamples);

#endif
