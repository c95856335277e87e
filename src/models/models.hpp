#ifndef MODELS_H
#define MODELS_H

#include <string>

#include "../complex/complex.hpp"

const unsigned int MODEL_COUNT = 8;

const double GANS_SCALE = 10.0;
const double MAP_SCALE = 3.0;

// Maps from each model of the hyperbolic plane to the Poincare disk
Complex mapPoincareDisk(Complex z);
Complex mapUpperHalfPlane(Complex z);
Complex mapBeltramiKlein(Complex z);
Complex mapInvertedPoincare(Complex z);
Complex mapGans(Complex z);
Complex mapAzimuthalEquidistant(Complex z);
Complex mapEqualArea(Complex z);
Complex mapBand(Complex z);

// Out of range indices fall back to the Poincare disk
Complex applyModel(unsigned int modelIdx, const Complex& z);
std::string modelName(unsigned int modelIdx);

#endif
