#include <gtest/gtest.h>

#include "../src/presets/presets.hpp"
#include "../src/tiling/tiling.hpp"

class PresetsTest : public ::testing::Test {};

TEST_F(PresetsTest, DefaultKeepsThickness) {
    tilingSettings s = makePreset(presetKind::Default, 0.03);
    EXPECT_EQ(s.p, INITIAL_P);
    EXPECT_EQ(s.q, INITIAL_Q);
    EXPECT_DOUBLE_EQ(s.edgeThickness, 0.03);
    EXPECT_TRUE(s.doEdges);
}

TEST_F(PresetsTest, RotatingSnakes) {
    tilingSettings s = makePreset(presetKind::RotatingSnakes, 0.025);
    EXPECT_EQ(s.p, 5);
    EXPECT_EQ(s.q, 5);
    EXPECT_DOUBLE_EQ(s.edgeThickness, 0.025);
    EXPECT_TRUE(s.doSnake);
    EXPECT_FALSE(s.doEdges);
    EXPECT_FALSE(s.doVerts);
    EXPECT_FALSE(s.doOrns);
}

TEST_F(PresetsTest, PrimroseField) {
    tilingSettings s = makePreset(presetKind::PrimroseField);
    EXPECT_EQ(s.p, 4);
    EXPECT_EQ(s.q, 6);
    EXPECT_DOUBLE_EQ(s.edgeThickness, 0.02);
    EXPECT_FALSE(s.doEdges);
    EXPECT_TRUE(s.doOrns);
    EXPECT_TRUE(s.doInvVerts);
    EXPECT_TRUE(s.doInvPol);
    EXPECT_EQ(s.polygonColIdx, 7u);
    EXPECT_EQ(s.invPolygonColIdx, 8u);
    EXPECT_EQ(s.vertColIdx, 0u);
    EXPECT_EQ(s.invVertColIdx, 9u);
}

TEST_F(PresetsTest, ScintillatingGrid) {
    tilingSettings s = makePreset(presetKind::ScintillatingGrid);
    EXPECT_EQ(s.p, 3);
    EXPECT_EQ(s.q, 7);
    EXPECT_DOUBLE_EQ(s.edgeThickness, 0.015);
    EXPECT_TRUE(s.doVerts);
    EXPECT_TRUE(s.doV0V1);
    EXPECT_FALSE(s.doV1V2);
    EXPECT_TRUE(s.doV2V0);
    EXPECT_EQ(s.edgeColIdx, 6u);
    EXPECT_EQ(s.polygonColIdx, 2u);
    EXPECT_EQ(s.vertColIdx, 0u);
}

TEST_F(PresetsTest, HermannGrid) {
    tilingSettings s = makePreset(presetKind::HermannGrid);
    EXPECT_EQ(s.p, 4);
    EXPECT_EQ(s.q, 5);
    EXPECT_DOUBLE_EQ(s.edgeThickness, 0.02);
    EXPECT_FALSE(s.doVerts);
    EXPECT_TRUE(s.doV0V1);
    EXPECT_TRUE(s.doV1V2);
    EXPECT_FALSE(s.doV2V0);
    EXPECT_EQ(s.edgeColIdx, 0u);
    EXPECT_EQ(s.polygonColIdx, 2u);
}

TEST_F(PresetsTest, PresetsDoNotInheritState) {
    tilingSettings snakes = makePreset(presetKind::RotatingSnakes);
    tilingSettings hermann = makePreset(presetKind::HermannGrid);
    EXPECT_TRUE(snakes.doSnake);
    EXPECT_FALSE(hermann.doSnake);
    EXPECT_FALSE(hermann.doInvPol);
}

TEST_F(PresetsTest, EveryPresetBuildsATiling) {
    presetKind kinds[] = {
        presetKind::Default,
        presetKind::RotatingSnakes,
        presetKind::PrimroseField,
        presetKind::ScintillatingGrid,
        presetKind::HermannGrid,
    };

    for (presetKind kind : kinds) {
        tilingSettings s = makePreset(kind);
        EXPECT_NO_THROW(generateTilingParams(s.p, s.q, s.edgeThickness)) << presetName(kind);
        EXPECT_FALSE(presetName(kind).empty());
    }
}

// === ROTATING SNAKES TOGGLE ===

TEST_F(PresetsTest, SnakesToggleOnResetsView) {
    tilingSettings s = makePreset(presetKind::PrimroseField);
    s.modelIdx = 4;
    s.doParity = true;
    s.doVerts = true;

    tilingSettings on = setRotatingSnakes(s, true);
    EXPECT_EQ(on.p, 5);
    EXPECT_EQ(on.q, 5);
    EXPECT_DOUBLE_EQ(on.edgeThickness, s.edgeThickness);
    EXPECT_EQ(on.modelIdx, 0u);
    EXPECT_TRUE(on.doSnake);
    EXPECT_FALSE(on.doEdges);
    EXPECT_FALSE(on.doVerts);
    EXPECT_FALSE(on.doOrns);
    EXPECT_FALSE(on.doInvPol);
    EXPECT_FALSE(on.doParity);
    EXPECT_TRUE(on.doSolidColor);
}

TEST_F(PresetsTest, SnakesToggleOffAlsoResetsView) {
    tilingSettings s = makePreset(presetKind::RotatingSnakes);
    s.p = 7;
    s.q = 3;
    s.modelIdx = 2;
    s.doParity = true;
    s = setSolidColour(s, false);
    s.doOrns = true;
    s.doInvPol = true;

    tilingSettings off = setRotatingSnakes(s, false);
    EXPECT_EQ(off.p, 5);
    EXPECT_EQ(off.q, 5);
    EXPECT_EQ(off.modelIdx, 0u);
    EXPECT_FALSE(off.doSnake);
    EXPECT_TRUE(off.doEdges);
    EXPECT_FALSE(off.doParity);
    EXPECT_TRUE(off.doSolidColor);

    // Vertex and checkerboard choices are left alone when turning off
    EXPECT_TRUE(off.doOrns);
    EXPECT_TRUE(off.doInvPol);
}

TEST_F(PresetsTest, SnakesPresetMatchesToggle) {
    tilingSettings preset = makePreset(presetKind::RotatingSnakes, 0.02);
    tilingSettings base;
    base.edgeThickness = 0.02;
    tilingSettings toggled = setRotatingSnakes(base, true);

    EXPECT_EQ(preset.p, toggled.p);
    EXPECT_EQ(preset.q, toggled.q);
    EXPECT_EQ(preset.doSnake, toggled.doSnake);
    EXPECT_EQ(preset.doEdges, toggled.doEdges);
    EXPECT_DOUBLE_EQ(preset.edgeThickness, toggled.edgeThickness);
}
