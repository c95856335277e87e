#include <gtest/gtest.h>
#include <cmath>

#include "../src/geometry/geometry.hpp"
#include "test_helpers.hpp"

using test_utils::complexNear;

class GeometryTest : public ::testing::Test {
protected:
    Complex a{ 0.0, 0.0 };
    Complex b{ 1.0, 0.0 };
    Complex c{ 0.0, 1.0 };
};

// === CIRCLES ===

TEST_F(GeometryTest, InsideCircleIsStrict) {
    circle unit{ CMP_ZERO, 1.0 };
    EXPECT_TRUE(isInsideCircle(Complex(0.5, 0.5), unit));
    EXPECT_FALSE(isInsideCircle(Complex(1.0, 0.0), unit));
    EXPECT_FALSE(isInsideCircle(Complex(2.0, 0.0), unit));
}

TEST_F(GeometryTest, CircleThroughThreePoints) {
    std::optional<circle> unit = circleFrom3Points(Complex(1.0, 0.0), Complex(0.0, 1.0), Complex(-1.0, 0.0));
    ASSERT_TRUE(unit.has_value());
    EXPECT_TRUE(complexNear(unit->center, CMP_ZERO));
    EXPECT_NEAR(unit->radius, 1.0, 1e-12);

    std::optional<circle> shifted = circleFrom3Points(Complex(3.0, 2.0), Complex(2.0, 3.0), Complex(1.0, 2.0));
    ASSERT_TRUE(shifted.has_value());
    EXPECT_TRUE(complexNear(shifted->center, Complex(2.0, 2.0)));
    EXPECT_NEAR(shifted->radius, 1.0, 1e-12);
}

TEST_F(GeometryTest, CollinearPointsHaveNoCircle) {
    EXPECT_FALSE(circleFrom3Points(Complex(0.0, 0.0), Complex(1.0, 1.0), Complex(2.0, 2.0)).has_value());
    EXPECT_FALSE(circleFrom3Points(b, b, c).has_value());
}

// === CIRCLE INTERSECTIONS ===

TEST_F(GeometryTest, TwoCrossingPoints) {
    std::vector<Complex> points = circleCircleIntersections(CMP_ZERO, 1.0, Complex(1.0, 0.0), 1.0);
    ASSERT_EQ(points.size(), 2u);

    double h = std::sqrt(3.0) / 2.0;
    bool firstUpper = points[0].imag() > 0.0;
    EXPECT_TRUE(complexNear(points[firstUpper ? 0 : 1], Complex(0.5, h)));
    EXPECT_TRUE(complexNear(points[firstUpper ? 1 : 0], Complex(0.5, -h)));
}

TEST_F(GeometryTest, TangentCirclesMeetOnce) {
    std::vector<Complex> points = circleCircleIntersections(CMP_ZERO, 1.0, Complex(2.0, 0.0), 1.0);
    ASSERT_EQ(points.size(), 1u);
    EXPECT_TRUE(complexNear(points[0], Complex(1.0, 0.0)));
}

TEST_F(GeometryTest, NoIntersectionCases) {
    // Identical
    EXPECT_TRUE(circleCircleIntersections(CMP_ZERO, 1.0, CMP_ZERO, 1.0).empty());
    // Separate
    EXPECT_TRUE(circleCircleIntersections(CMP_ZERO, 1.0, Complex(5.0, 0.0), 1.0).empty());
    // Contained
    EXPECT_TRUE(circleCircleIntersections(CMP_ZERO, 3.0, Complex(0.5, 0.0), 1.0).empty());
}

// === TRIANGLES ===

TEST_F(GeometryTest, PointInTriangle) {
    Complex centroid = (a + b + c) / 3.0;
    EXPECT_TRUE(isInsideTriangle(centroid, a, b, c));
    EXPECT_TRUE(isInsideTriangle(b, a, b, c));
    EXPECT_FALSE(isInsideTriangle(Complex(10.0, 10.0), a, b, c));
    EXPECT_FALSE(isInsideTriangle(Complex(0.6, 0.6), a, b, c));
}

TEST_F(GeometryTest, OrientationDoesNotMatter) {
    Complex centroid = (a + b + c) / 3.0;
    EXPECT_TRUE(isInsideTriangle(centroid, a, c, b));
}

TEST_F(GeometryTest, DegenerateTriangleContainsNothing) {
    EXPECT_FALSE(isInsideTriangle(Complex(0.5, 0.5), a, Complex(1.0, 1.0), Complex(2.0, 2.0)));
}

// === LINES THROUGH THE ORIGIN ===

TEST_F(GeometryTest, OriginLinePicksNearestPoint) {
    std::optional<Complex> z = intersectCircleWithOriginLine(Complex(2.0, 0.0), 1.0, Complex(1.0, 0.0));
    ASSERT_TRUE(z.has_value());
    EXPECT_TRUE(complexNear(*z, Complex(1.0, 0.0)));

    Complex diagonal = versor(M_PI / 4.0);
    std::optional<Complex> d = intersectCircleWithOriginLine(CMP_ZERO, 1.0, diagonal);
    ASSERT_TRUE(d.has_value());
    EXPECT_NEAR(Complex::mag(*d), 1.0, 1e-12);
}

TEST_F(GeometryTest, VerticalOriginLine) {
    std::optional<Complex> z = intersectCircleWithOriginLine(Complex(0.0, 2.0), 1.0, CMP_I);
    ASSERT_TRUE(z.has_value());
    EXPECT_TRUE(complexNear(*z, Complex(0.0, 1.0)));

    EXPECT_FALSE(intersectCircleWithOriginLine(Complex(3.0, 0.0), 1.0, CMP_I).has_value());
}

TEST_F(GeometryTest, OriginLineMissesCircle) {
    EXPECT_FALSE(intersectCircleWithOriginLine(Complex(0.0, 3.0), 1.0, Complex(1.0, 0.0)).has_value());
}
