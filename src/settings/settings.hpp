#ifndef SETTINGS_H
#define SETTINGS_H

const int INITIAL_P = 4;
const int INITIAL_Q = 5;
const double INITIAL_EDGE_THICKNESS = 0.015;
const unsigned int INITIAL_ITERATIONS = 50;
const unsigned int INITIAL_SAMPLES = 5;

const int MIN_SIDES = 3;
const int MAX_SIDES = 20;
const double MIN_EDGE_THICKNESS = 0.005;
const double MAX_EDGE_THICKNESS = 0.145;
const unsigned int MIN_ITERATIONS = 20;
const unsigned int MAX_ITERATIONS = 100;
const unsigned int MIN_SAMPLES = 1;
const unsigned int MAX_SAMPLES = 50;

const double MIN_EXP_RATIO_RINGS = 0.005;
const double MAX_EXP_RATIO_RINGS = 2.0;
const unsigned int MIN_RING_LAYERS = 1;
const unsigned int MAX_RING_LAYERS = 50;
const double MIN_CENTER_CUTOFF = 0.0;
const double MAX_CENTER_CUTOFF = 1.0;
const unsigned int MIN_REPEATS_PER_SECTOR = 1;
const unsigned int MAX_REPEATS_PER_SECTOR = 10;

// Everything the classifier reads besides the tiling geometry and the pan offset
struct tilingSettings {
    int p = INITIAL_P;
    int q = INITIAL_Q;
    double edgeThickness = INITIAL_EDGE_THICKNESS;

    unsigned int modelIdx = 0;

    // Edges: a is V1V2, b is V0V1, c is V2V0
    bool doEdges = true;
    bool preciseEdges = true;
    bool doV0V1 = true;
    bool doV1V2 = true;
    bool doV2V0 = false;

    bool doVerts = false;
    bool doInvVerts = false;
    bool doOrns = false;

    bool doSolidColor = true;
    bool doInvPol = false;
    bool doParity = false;

    // Rotating snakes rings
    bool doSnake = false;
    bool doForeRev = false;
    bool doBackRev = false;
    double expRatioRings = 0.115;
    unsigned int ringLayerNum = 30;
    double centerCutoff = 0.05;
    unsigned int nRepeatPerSectV0 = 2;
    unsigned int nRepeatPerSectV2 = 2;

    // Palette indices
    unsigned int polygonColIdx = 0;
    unsigned int invPolygonColIdx = 8;
    unsigned int edgeColIdx = 2;
    unsigned int vertColIdx = 3;
    unsigned int invVertColIdx = 9;
    unsigned int bgColIdx = 2;

    unsigned int nIterations = INITIAL_ITERATIONS;
    unsigned int nSamples = INITIAL_SAMPLES;
};

// Clamps every field into the range the controls allow
tilingSettings sanitizeSettings(const tilingSettings& settings);

// Coupled toggles: circular vertices and ornaments exclude each other, and both carry the second vertex colour
tilingSettings setCircularVertices(const tilingSettings& settings, bool enabled);
tilingSettings setOrnamentedVertices(const tilingSettings& settings, bool enabled);

// The checkerboard needs a static polygon colour
tilingSettings setSolidColour(const tilingSettings& settings, bool enabled);
tilingSettings setCheckerboard(const tilingSettings& settings, bool enabled);

#endif
