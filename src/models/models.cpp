#include <cmath>

#include "models.hpp"
#include "../geometry/geometry.hpp"

typedef Complex (*modelMap)(Complex);

const modelMap MODEL_MAPS[MODEL_COUNT] = {
    mapPoincareDisk,
    mapUpperHalfPlane,
    mapBeltramiKlein,
    mapInvertedPoincare,
    mapGans,
    mapAzimuthalEquidistant,
    mapEqualArea,
    mapBand,
};

const char* const MODEL_NAMES[MODEL_COUNT] = {
    "Poincaré disk",
    "Upper half-plane model",
    "Beltrami-Klein disk",
    "Poincaré disk complement",
    "Gans model",
    "Azimuthal equidistant projection",
    "Equal-area projection",
    "Band model",
};

Complex mapPoincareDisk(Complex z) {
    return z;
}

Complex mapUpperHalfPlane(Complex z) {
    z += CMP_I;
    return (z - CMP_I) / (z + CMP_I);
}

Complex mapBeltramiKlein(Complex z) {
    return z / (1.0 + std::sqrt(1.0 - Complex::magSq(z)));
}

Complex mapInvertedPoincare(Complex z) {
    return Complex::reciprocal(z * MAP_SCALE);
}

Complex mapGans(Complex z) {
    z *= GANS_SCALE;
    return z / (1.0 + std::sqrt(1.0 + Complex::magSq(z)));
}

Complex mapAzimuthalEquidistant(Complex z) {
    z *= MAP_SCALE;
    double dist = Complex::mag(z);
    if (dist < GEOMETRY_EPSILON)
        return CMP_ZERO;

    return z * (std::tanh(dist * 0.5) / dist);
}

Complex mapEqualArea(Complex z) {
    z *= MAP_SCALE;
    return z / std::sqrt(1.0 + Complex::magSq(z));
}

Complex mapBand(Complex z) {
    return Complex::tanh(z);
}

Complex applyModel(unsigned int modelIdx, const Complex& z) {
    if (modelIdx >= MODEL_COUNT)
        return mapPoincareDisk(z);

    return MODEL_MAPS[modelIdx](z);
}

std::string modelName(unsigned int modelIdx) {
    if (modelIdx >= MODEL_COUNT)
        return MODEL_NAMES[0];

    return MODEL_NAMES[modelIdx];
}
