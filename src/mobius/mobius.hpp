#ifndef MOBIUS_H
#define MOBIUS_H

#include "../complex/complex.hpp"

// The first of the two square roots, k = 0 in Complex::root
const unsigned int DEFAULT_ROOT_BRANCH = 0;

// z -> (az + b) / (cz + d)
struct mobiusTransform {
    Complex a;
    Complex b;
    Complex c;
    Complex d;
};

/*
 * Builds the transform sending P -> -1, Q -> 0, R -> 1.
 * The coefficients share the denominator sqrt(2(P - R)(Q - P)(Q - R)); rootBranch picks
 * which of its two square roots is used. The other branch flips the sign of a, b, c, d.
 * Throws DegenerateGeometryError when two of the points coincide.
 */
mobiusTransform mobiusFromPoints(const Complex& P, const Complex& Q, const Complex& R, unsigned int rootBranch = DEFAULT_ROOT_BRANCH);

// Forward map, or (dz - b) / (a - cz) when inverted
Complex applyMobius(const mobiusTransform& map, const Complex& z, bool inverted = false);

// Reflection in the geodesic the transform sends to the real axis
Complex reflectInEdge(const mobiusTransform& map, const Complex& z);

#endif
