#include <cmath>

#include "geometry.hpp"

bool isInsideCircle(const Complex& z, const circle& c) {
    return Complex::magSq(z - c.center) < c.radius * c.radius;
}

std::optional<circle> circleFrom3Points(const Complex& p1, const Complex& p2, const Complex& p3) {
    // Perpendicular bisector system A*cx + B*cy = E, C*cx + D*cy = F
    double A = p1.real() - p2.real();
    double B = p1.imag() - p2.imag();
    double C = p1.real() - p3.real();
    double D = p1.imag() - p3.imag();
    double E = (Complex::magSq(p1) - Complex::magSq(p2)) * 0.5;
    double F = (Complex::magSq(p1) - Complex::magSq(p3)) * 0.5;

    double det = A * D - B * C;
    if (std::fabs(det) < GEOMETRY_EPSILON)
        return std::nullopt;

    Complex center((D * E - B * F) / det, (-C * E + A * F) / det);
    return circle{ center, Complex::mag(center - p1) };
}

std::vector<Complex> circleCircleIntersections(const Complex& c1, double r1, const Complex& c2, double r2) {
    Complex dVec = c2 - c1;
    double d = Complex::mag(dVec);

    if (d > r1 + r2 || d < std::fabs(r1 - r2) || d < GEOMETRY_EPSILON)
        return {};

    // Distance from c1 to the chord midpoint
    double x = (r1 * r1 - r2 * r2 + d * d) / (2.0 * d);
    double h2 = r1 * r1 - x * x;
    if (h2 < 0.0)
        h2 = 0.0;

    Complex midpoint = c1 + dVec * (x / d);
    Complex perp = Complex::normalized(Complex(-dVec.imag(), dVec.real()));
    double h = std::sqrt(h2);

    Complex i1 = midpoint + perp * h;
    if (h < GEOMETRY_EPSILON)
        return { i1 };

    return { i1, midpoint - perp * h };
}

bool isInsideTriangle(const Complex& p, const Complex& a, const Complex& b, const Complex& c) {
    double denominator =
        (b.imag() - c.imag()) * (a.real() - c.real()) +
        (c.real() - b.real()) * (a.imag() - c.imag());

    if (std::fabs(denominator) < GEOMETRY_EPSILON)
        return false;

    double alpha =
        ((b.imag() - c.imag()) * (p.real() - c.real()) +
         (c.real() - b.real()) * (p.imag() - c.imag())) / denominator;

    double beta =
        ((c.imag() - a.imag()) * (p.real() - c.real()) +
         (a.real() - c.real()) * (p.imag() - c.imag())) / denominator;

    double gamma = 1.0 - alpha - beta;

    return alpha >= 0.0 && beta >= 0.0 && gamma >= 0.0;
}

std::optional<Complex> intersectCircleWithOriginLine(const Complex& center, double radius, const Complex& direction) {
    // Line nx*x + ny*y = 0 with normal (direction.y, -direction.x)
    double nx = direction.imag();
    double ny = -direction.real();

    double cx = center.real();
    double cy = center.imag();

    Complex cand1;
    Complex cand2;

    if (std::fabs(ny) > GEOMETRY_EPSILON) {
        // y = slope * x substituted into (x - cx)^2 + (y - cy)^2 = r^2
        double slope = -nx / ny;

        double A = 1.0 + slope * slope;
        double B = -2.0 * (cx + slope * cy);
        double C = cx * cx + cy * cy - radius * radius;

        double disc = B * B - 4.0 * A * C;
        if (disc < 0.0)
            return std::nullopt;

        double x1 = (-B + std::sqrt(disc)) / (2.0 * A);
        double x2 = (-B - std::sqrt(disc)) / (2.0 * A);

        cand1 = Complex(x1, slope * x1);
        cand2 = Complex(x2, slope * x2);
    }
    else {
        // Vertical line x = 0. A miss is reported as in the sloped case instead of
        // clamping radTerm to 0; the tiling never asks for this direction since p >= 3.
        double radTerm = radius * radius - cx * cx;
        if (radTerm < 0.0)
            return std::nullopt;

        cand1 = Complex(0.0, cy + std::sqrt(radTerm));
        cand2 = Complex(0.0, cy - std::sqrt(radTerm));
    }

    return Complex::mag(cand1) < Complex::mag(cand2) ? cand1 : cand2;
}
