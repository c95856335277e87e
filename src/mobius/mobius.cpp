#include <vector>

#include "mobius.hpp"
#include "../errors/tiling_errors.hpp"
#include "../geometry/geometry.hpp"

mobiusTransform mobiusFromPoints(const Complex& P, const Complex& Q, const Complex& R, unsigned int rootBranch) {
    Complex PR = P - R;
    Complex QP = Q - P;
    Complex QR = Q - R;

    Complex denomSq = PR * QP * QR * 2.0;
    if (Complex::mag(denomSq) < GEOMETRY_EPSILON)
        throw DegenerateGeometryError("Mobius transform requested for coincident points");

    std::vector<Complex> denoms = Complex::root(denomSq, 2);
    Complex denom = denoms[rootBranch % denoms.size()];

    return mobiusTransform{
        PR / denom,
        (-Q * PR) / denom,
        (QP + QR) / denom,
        ((-P * QR) - R * QP) / denom
    };
}

Complex applyMobius(const mobiusTransform& map, const Complex& z, bool inverted) {
    if (inverted)
        return (map.d * z - map.b) / (map.a - map.c * z);

    return (map.a * z + map.b) / (map.d + map.c * z);
}

Complex reflectInEdge(const mobiusTransform& map, const Complex& z) {
    Complex w = applyMobius(map, z);
    return applyMobius(map, Complex::conj(w), true);
}
