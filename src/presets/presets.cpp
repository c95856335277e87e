#include "presets.hpp"

static tilingSettings rotatingSnakes(double edgeThickness) {
    tilingSettings s;
    s.edgeThickness = edgeThickness;
    return setRotatingSnakes(s, true);
}

static tilingSettings primroseField() {
    tilingSettings s;
    s.p = 4;
    s.q = 6;
    s.edgeThickness = 0.02;

    s.doEdges = false;
    s.doVerts = false;
    s.doInvVerts = true;
    s.doOrns = true;
    s.doInvPol = true;
    s.doParity = false;
    s.doSolidColor = true;
    s.doSnake = false;

    s.polygonColIdx = 7;
    s.invPolygonColIdx = 8;
    s.vertColIdx = 0;
    s.invVertColIdx = 9;
    return s;
}

static tilingSettings scintillatingGrid() {
    tilingSettings s;
    s.p = 3;
    s.q = 7;
    s.edgeThickness = 0.015;

    s.doVerts = true;
    s.doInvVerts = false;
    s.doOrns = false;

    s.doEdges = true;
    s.doV0V1 = true;
    s.doV1V2 = false;
    s.doV2V0 = true;

    s.doInvPol = false;
    s.doParity = false;
    s.doSolidColor = true;
    s.doSnake = false;

    s.edgeColIdx = 6;
    s.polygonColIdx = 2;
    s.vertColIdx = 0;
    return s;
}

static tilingSettings hermannGrid() {
    tilingSettings s;
    s.p = 4;
    s.q = 5;
    s.edgeThickness = 0.02;

    s.doVerts = false;
    s.doInvVerts = false;
    s.doOrns = false;

    s.doEdges = true;
    s.doV0V1 = true;
    s.doV1V2 = true;
    s.doV2V0 = false;

    s.doInvPol = false;
    s.doParity = false;
    s.doSolidColor = true;
    s.doSnake = false;

    s.edgeColIdx = 0;
    s.polygonColIdx = 2;
    return s;
}

tilingSettings makePreset(presetKind kind, double edgeThickness) {
    switch (kind) {
        case presetKind::RotatingSnakes:
            return rotatingSnakes(edgeThickness);
        case presetKind::PrimroseField:
            return primroseField();
        case presetKind::ScintillatingGrid:
            return scintillatingGrid();
        case presetKind::HermannGrid:
            return hermannGrid();
        case presetKind::Default:
        default: {
            tilingSettings s;
            s.edgeThickness = edgeThickness;
            return s;
        }
    }
}

std::string presetName(presetKind kind) {
    switch (kind) {
        case presetKind::RotatingSnakes:
            return "Kitaoka's Rotating Snakes illusion";
        case presetKind::PrimroseField:
            return "Kitaoka's Primrose Field illusion";
        case presetKind::ScintillatingGrid:
            return "Scintillating Grid illusion";
        case presetKind::HermannGrid:
            return "Hermann Grid illusion";
        case presetKind::Default:
        default:
            return "Default";
    }
}

tilingSettings setRotatingSnakes(const tilingSettings& settings, bool enabled) {
    tilingSettings s = settings;
    s.p = 5;
    s.q = 5;
    s.modelIdx = 0;

    if (enabled) {
        s.doVerts = false;
        s.doOrns = false;
        s.doInvPol = false;
    }

    s.doEdges = !enabled;
    s.doParity = false;
    s.doSolidColor = true;
    s.doSnake = enabled;
    return s;
}
