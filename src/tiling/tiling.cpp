#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "tiling.hpp"
#include "../errors/tiling_errors.hpp"
#include "../mobius/mobius.hpp"

static circle requireCircle(const Complex& p1, const Complex& p2, const Complex& p3, const char* what) {
    std::optional<circle> c = circleFrom3Points(p1, p2, p3);
    if (!c)
        throw DegenerateGeometryError(std::string("Collinear points while fitting ") + what);

    return *c;
}

static Complex requireOriginLineIntersection(const circle& c, const Complex& direction, const char* what) {
    std::optional<Complex> z = intersectCircleWithOriginLine(c.center, c.radius, direction);
    if (!z)
        throw DegenerateGeometryError(std::string("No intersection with the mirror line for ") + what);

    return *z;
}

// Crossing of two thick-edge circles that lies inside the straight triangle V0 V1 V2
static Complex cornerIntersection(const circle& a, const circle& b, const tilingDescriptor& desc, const char* what) {
    std::vector<Complex> points = circleCircleIntersections(a.center, a.radius, b.center, b.radius);

    for (const Complex& z : points) {
        if (isInsideTriangle(z, desc.V0, desc.V1, desc.V2))
            return z;
    }

    throw DegenerateGeometryError(std::string("Thick edges do not meet inside the triangle at ") + what);
}

// Circle through P and its mirror images in both adjoining edges
static circle enlargedCircleAtPoint(const Complex& P, const mobiusTransform& mapA, const mobiusTransform& mapB, const char* what) {
    return requireCircle(P, reflectInEdge(mapA, P), reflectInEdge(mapB, P), what);
}

// Circle through the edge's ideal endpoints and the thickening point pulled back from the canonical frame
static circle thickEdgeCircle(const mobiusTransform& map, const Complex& end1, const Complex& end2, double edgeThickness, const char* what) {
    Complex displaced = applyMobius(map, Complex(0.0, edgeThickness), true);
    return requireCircle(end1, end2, displaced, what);
}

static Complex ornament(const Complex& D, const Complex& towards) {
    double thetaD = Complex::arg(D);
    double thetaRef = Complex::arg(towards);
    double thetaE = thetaD + ORNAMENT_ANGLE_RATIO * (thetaRef - thetaD);

    return versor(thetaE) * (ORNAMENT_LENGTH_RATIO * Complex::mag(D));
}

// (x, y) -> (-x, y)
static Complex mirrorImag(const Complex& z) {
    return Complex(-z.real(), z.imag());
}

bool isValidTiling(int p, int q) {
    return p >= 3 && q >= 3 && (p - 2) * (q - 2) > 4;
}

tilingDescriptor generateTilingParams(int p, int q, double edgeThickness) {
    if (!isValidTiling(p, q))
        throw InvalidTilingError("{" + std::to_string(p) + ", " + std::to_string(q) + "} is not a hyperbolic tiling");

    if (!(edgeThickness > 0.0))
        throw InvalidTilingError("Edge thickness must be positive");

    tilingDescriptor desc{};
    desc.p = p;
    desc.q = q;
    desc.edgeThickness = edgeThickness;

    double alpha = M_PI / p;
    double beta = M_PI / q;
    Complex refDir = versor(alpha);

    // Euclidean distance from the polygon's centre to its vertices
    double cotq = 1.0 / std::tan(beta);
    double tanp = refDir.imag() / refDir.real();
    double rSide = std::sqrt((cotq - tanp) / (cotq + tanp));

    // Inversion circle realising the reflection in edge V1V2
    double cenX = 0.5 * (rSide * rSide + 1.0) / (rSide * refDir.real());
    double invRadSq = cenX * cenX + (-2.0 * refDir.real() * cenX + rSide) * rSide;
    desc.invCen = Complex(cenX, 0.0);
    desc.invRad = std::sqrt(invRadSq);
    desc.refNrm = Complex(refDir.imag(), -refDir.real());

    // Fundamental triangle
    desc.V0 = CMP_ZERO;
    Complex toInvCen = desc.invCen - desc.V0;
    desc.V1 = Complex::normalized(toInvCen) * (Complex::mag(toInvCen) - desc.invRad);
    desc.V2 = requireOriginLineIntersection(circle{ desc.invCen, desc.invRad }, refDir, "vertex V2");

    // Edge V0V1 on the real axis
    mobiusTransform map01 = mobiusFromPoints(Complex(-1.0, 0.0), desc.V0, Complex(1.0, 0.0));
    desc.thickEdge01 = thickEdgeCircle(map01, Complex(-1.0, 0.0), Complex(1.0, 0.0), edgeThickness, "thick edge V0V1");

    // Edge V1V2 on the inversion circle, ending where it meets the unit circle
    std::vector<Complex> ideal = circleCircleIntersections(desc.invCen, desc.invRad, desc.V0, 1.0);
    if (ideal.size() != 2)
        throw DegenerateGeometryError("Inversion circle does not cross the unit circle twice");

    std::sort(ideal.begin(), ideal.end(), [](const Complex& a, const Complex& b) { return a.imag() > b.imag(); });
    const Complex& upper = ideal[0];
    const Complex& lower = ideal[1];

    mobiusTransform map12 = mobiusFromPoints(lower, desc.V1, upper);
    desc.thickEdge12 = thickEdgeCircle(map12, upper, lower, edgeThickness, "thick edge V1V2");

    // Edge V2V0 along the diameter through V2
    Complex end20 = desc.V2 / Complex::mag(desc.V2);
    mobiusTransform map20 = mobiusFromPoints(end20, desc.V0, -end20);
    desc.thickEdge20 = thickEdgeCircle(map20, end20, -end20, edgeThickness, "thick edge V2V0");

    // Rounded corners where two thick edges meet
    Complex corner0 = cornerIntersection(desc.thickEdge20, desc.thickEdge01, desc, "V0");
    desc.triV0Enlarged = enlargedCircleAtPoint(corner0, map20, map01, "corner V0");

    Complex corner1 = cornerIntersection(desc.thickEdge01, desc.thickEdge12, desc, "V1");
    desc.triV1Enlarged = enlargedCircleAtPoint(corner1, map01, map12, "corner V1");

    Complex corner2 = cornerIntersection(desc.thickEdge12, desc.thickEdge20, desc, "V2");
    desc.triV2Enlarged = enlargedCircleAtPoint(corner2, map12, map20, "corner V2");

    // Rounded corner at V2 when only V1V2 is thick, anchored where it crosses V2V0
    Complex V2a = requireOriginLineIntersection(desc.thickEdge12, refDir, "corner V2 of edge V1V2");
    Complex V2b = reflectInEdge(map12, V2a);
    Complex V2c = reflectInEdge(map20, V2b);
    desc.V2Enlarged = requireCircle(V2a, V2b, V2c, "enlarged V2");

    // Rounded corner at V0 when only V0V1 is thick
    Complex V0a = requireOriginLineIntersection(desc.thickEdge01, refDir, "corner V0 of edge V0V1");
    Complex V0b = Complex::conj(V0a);
    Complex V0c = reflectInEdge(map20, V0b);
    desc.V0Enlarged = requireCircle(V0a, V0b, V0c, "enlarged V0");

    // Ornaments, built about the origin and carried to each vertex
    desc.D = Complex(edgeThickness * ORNAMENT_SCALE, 0.0);
    desc.E = ornament(desc.D, desc.V2);

    mobiusTransform mapV2 = mobiusFromPoints(lower, desc.V2, upper);
    Complex localE2 = ornament(mirrorImag(desc.D), applyMobius(mapV2, desc.V0));
    desc.D2 = applyMobius(mapV2, mirrorImag(desc.D), true);
    desc.E2 = applyMobius(mapV2, localE2, true);

    desc.D1 = applyMobius(map12, desc.D, true);
    desc.E1 = applyMobius(map12, desc.E, true);

    mobiusTransform mapV1 = mobiusFromPoints(Complex(-1.0, 0.0), desc.V1, Complex(1.0, 0.0));
    desc.D1p = applyMobius(mapV1, mirrorImag(desc.D), true);
    desc.E1p = applyMobius(mapV1, mirrorImag(desc.E), true);

    // V1 rotated twice about V2 by the edge reflections
    Complex V1Ref20 = reflectInEdge(map20, desc.V1);
    Complex V1Ref20Ref12 = reflectInEdge(map12, V1Ref20);
    desc.C2RotSnakes = requireCircle(desc.V1, V1Ref20, V1Ref20Ref12, "rotating snakes circle");

    return desc;
}

TilingCache::TilingCache(size_t maxEntries) : capacity(maxEntries > 0 ? maxEntries : 1) {}

tilingDescriptor TilingCache::get(int p, int q, double edgeThickness) {
    std::lock_guard<std::mutex> lock(cacheMutex);

    auto key = std::make_tuple(p, q, edgeThickness);
    auto it = descriptors.find(key);
    if (it != descriptors.end())
        return it->second;

    tilingDescriptor desc = generateTilingParams(p, q, edgeThickness);
    if (descriptors.size() >= capacity)
        descriptors.clear();

    descriptors.emplace(key, desc);
    return desc;
}

void TilingCache::clear() {
    std::lock_guard<std::mutex> lock(cacheMutex);
    descriptors.clear();
}

size_t TilingCache::size() {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return descriptors.size();
}
