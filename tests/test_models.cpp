#include <gtest/gtest.h>
#include <cmath>

#include "../src/models/models.hpp"
#include "test_helpers.hpp"

using test_utils::complexNear;

class ModelsTest : public ::testing::Test {
protected:
    Complex third{ 1.0 / 3.0, 0.0 };
};

TEST_F(ModelsTest, PoincareDiskIsIdentity) {
    Complex z(0.3, -0.2);
    EXPECT_TRUE(complexNear(applyModel(0, z), z));
}

TEST_F(ModelsTest, UpperHalfPlane) {
    // The view is shifted up by i so its centre lands on the disk centre
    EXPECT_TRUE(complexNear(mapUpperHalfPlane(CMP_ZERO), CMP_ZERO));
    EXPECT_TRUE(complexNear(mapUpperHalfPlane(Complex(0.0, -1.0)), Complex(-1.0, 0.0)));
    EXPECT_LT(Complex::mag(mapUpperHalfPlane(Complex(0.3, 0.5))), 1.0);
    EXPECT_GT(Complex::mag(mapUpperHalfPlane(Complex(0.0, -1.5))), 1.0);
}

TEST_F(ModelsTest, BeltramiKlein) {
    EXPECT_TRUE(complexNear(mapBeltramiKlein(Complex(0.5, 0.0)), Complex(0.5 / (1.0 + std::sqrt(0.75)), 0.0)));
    // Outside the Klein disk there is no preimage
    EXPECT_FALSE(Complex::magSq(mapBeltramiKlein(Complex(1.5, 0.0))) < 1.0);
}

TEST_F(ModelsTest, InvertedPoincare) {
    EXPECT_TRUE(complexNear(mapInvertedPoincare(third), CMP_ONE));
    EXPECT_TRUE(complexNear(mapInvertedPoincare(third * 2.0), Complex(0.5, 0.0)));
}

TEST_F(ModelsTest, Gans) {
    EXPECT_TRUE(complexNear(mapGans(CMP_ZERO), CMP_ZERO));
    EXPECT_TRUE(complexNear(mapGans(Complex(0.1, 0.0)), Complex(1.0 / (1.0 + std::sqrt(2.0)), 0.0)));
    EXPECT_LT(Complex::mag(mapGans(Complex(50.0, 50.0))), 1.0);
}

TEST_F(ModelsTest, AzimuthalEquidistant) {
    EXPECT_TRUE(complexNear(mapAzimuthalEquidistant(CMP_ZERO), CMP_ZERO));
    EXPECT_TRUE(complexNear(mapAzimuthalEquidistant(third), Complex(std::tanh(0.5), 0.0)));
}

TEST_F(ModelsTest, EqualArea) {
    EXPECT_TRUE(complexNear(mapEqualArea(third), Complex(1.0 / std::sqrt(2.0), 0.0)));
    EXPECT_LT(Complex::mag(mapEqualArea(Complex(-4.0, 7.0))), 1.0);
}

TEST_F(ModelsTest, Band) {
    EXPECT_TRUE(complexNear(mapBand(Complex(0.5, 0.0)), Complex(std::tanh(0.5), 0.0)));
    EXPECT_TRUE(complexNear(mapBand(Complex(0.0, M_PI / 4.0)), CMP_I));
}

TEST_F(ModelsTest, TableMatchesFunctions) {
    Complex z(0.2, 0.1);
    EXPECT_TRUE(complexNear(applyModel(1, z), mapUpperHalfPlane(z)));
    EXPECT_TRUE(complexNear(applyModel(2, z), mapBeltramiKlein(z)));
    EXPECT_TRUE(complexNear(applyModel(3, z), mapInvertedPoincare(z)));
    EXPECT_TRUE(complexNear(applyModel(4, z), mapGans(z)));
    EXPECT_TRUE(complexNear(applyModel(5, z), mapAzimuthalEquidistant(z)));
    EXPECT_TRUE(complexNear(applyModel(6, z), mapEqualArea(z)));
    EXPECT_TRUE(complexNear(applyModel(7, z), mapBand(z)));
}

TEST_F(ModelsTest, OutOfRangeFallsBackToDisk) {
    Complex z(0.4, 0.4);
    EXPECT_TRUE(complexNear(applyModel(MODEL_COUNT, z), z));
    EXPECT_EQ(modelName(MODEL_COUNT + 3), modelName(0));
}

TEST_F(ModelsTest, Names) {
    EXPECT_EQ(modelName(0), "Poincaré disk");
    EXPECT_EQ(modelName(7), "Band model");

    for (unsigned int i = 0; i < MODEL_COUNT; i++)
        EXPECT_FALSE(modelName(i).empty());
}
