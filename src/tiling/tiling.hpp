#ifndef TILING_H
#define TILING_H

#include <cstddef>
#include <map>
#include <mutex>
#include <tuple>

#include "../complex/complex.hpp"
#include "../geometry/geometry.hpp"

// Fixed ratios of the vertex ornament triangles
const double ORNAMENT_LENGTH_RATIO = 0.6;
const double ORNAMENT_ANGLE_RATIO = 0.6;
const double ORNAMENT_SCALE = 4.0;

/*
 * Fundamental triangle V0 V1 V2 of the {p, q} tiling in the Poincare disk, with
 * V0 at the centre of a p-gon, V1 at an edge midpoint and V2 at a tiling vertex.
 * Edge V1V2 lies on the inversion circle, V2V0 on the line with normal refNrm
 * and V0V1 on the real axis.
 */
struct tilingDescriptor {
    int p;
    int q;
    double edgeThickness;

    Complex invCen;
    double invRad;
    Complex refNrm;

    Complex V0;
    Complex V1;
    Complex V2;

    // Ornament triangles (V0, D, E), (V1, D1, E1), (V1, D1p, E1p), (V2, D2, E2)
    Complex D;
    Complex E;
    Complex D1;
    Complex E1;
    Complex D1p;
    Complex E1p;
    Complex D2;
    Complex E2;

    // Interior of each circle is the widened edge inside the triangle
    circle thickEdge01;
    circle thickEdge12;
    circle thickEdge20;

    // Rounded corners where both adjoining edges are thick
    circle triV0Enlarged;
    circle triV1Enlarged;
    circle triV2Enlarged;

    // Rounded corners where only edge V0V1 (resp. V1V2) is thick
    circle V0Enlarged;
    circle V2Enlarged;

    // Hyperbolic circle about V2 through V1
    circle C2RotSnakes;
};

bool isValidTiling(int p, int q);

// Throws InvalidTilingError for invalid input and DegenerateGeometryError if a construction fails
tilingDescriptor generateTilingParams(int p, int q, double edgeThickness);

// Every thickness slider stop is a new key, so the map is bounded
const size_t DEFAULT_TILING_CACHE_CAPACITY = 64;

// Memoizes descriptors by (p, q, edgeThickness). Starts over once capacity entries are stored.
class TilingCache {
    public:
        explicit TilingCache(size_t maxEntries = DEFAULT_TILING_CACHE_CAPACITY);

        tilingDescriptor get(int p, int q, double edgeThickness);
        void clear();
        size_t size();

    private:
        size_t capacity;
        std::mutex cacheMutex;
        std::map<std::tuple<int, int, double>, tilingDescriptor> descriptors;
};

#endif
