#ifndef GEOMETRY_H
#define GEOMETRY_H

#include <optional>
#include <vector>

#include "../complex/complex.hpp"

const double GEOMETRY_EPSILON = 1e-12;

struct circle {
    Complex center;
    double radius;
};

bool isInsideCircle(const Complex& z, const circle& c);

// Circumcircle of p1, p2, p3, or nothing when the points are collinear
std::optional<circle> circleFrom3Points(const Complex& p1, const Complex& p2, const Complex& p3);

// Zero points for separate, contained or coincident circles, one point for tangency, two otherwise
std::vector<Complex> circleCircleIntersections(const Complex& c1, double r1, const Complex& c2, double r2);

// Barycentric test, boundary counts as inside, degenerate triangles contain nothing
bool isInsideTriangle(const Complex& p, const Complex& a, const Complex& b, const Complex& c);

// Intersection closest to the origin of the circle with the line through the origin along direction,
// or nothing when the line misses the circle
std::optional<Complex> intersectCircleWithOriginLine(const Complex& center, double radius, const Complex& direction);

#endif
