#include <algorithm>

#include "settings.hpp"
#include "../colour/colour.hpp"
#include "../models/models.hpp"

static unsigned int clampPaletteIdx(unsigned int idx) {
    return std::min(idx, PALETTE_SIZE - 1);
}

tilingSettings sanitizeSettings(const tilingSettings& settings) {
    tilingSettings s = settings;

    s.p = std::clamp(s.p, MIN_SIDES, MAX_SIDES);
    s.q = std::clamp(s.q, MIN_SIDES, MAX_SIDES);
    s.edgeThickness = std::clamp(s.edgeThickness, MIN_EDGE_THICKNESS, MAX_EDGE_THICKNESS);

    if (s.modelIdx >= MODEL_COUNT)
        s.modelIdx = 0;

    s.expRatioRings = std::clamp(s.expRatioRings, MIN_EXP_RATIO_RINGS, MAX_EXP_RATIO_RINGS);
    s.ringLayerNum = std::clamp(s.ringLayerNum, MIN_RING_LAYERS, MAX_RING_LAYERS);
    s.centerCutoff = std::clamp(s.centerCutoff, MIN_CENTER_CUTOFF, MAX_CENTER_CUTOFF);
    s.nRepeatPerSectV0 = std::clamp(s.nRepeatPerSectV0, MIN_REPEATS_PER_SECTOR, MAX_REPEATS_PER_SECTOR);
    s.nRepeatPerSectV2 = std::clamp(s.nRepeatPerSectV2, MIN_REPEATS_PER_SECTOR, MAX_REPEATS_PER_SECTOR);

    s.polygonColIdx = clampPaletteIdx(s.polygonColIdx);
    s.invPolygonColIdx = clampPaletteIdx(s.invPolygonColIdx);
    s.edgeColIdx = clampPaletteIdx(s.edgeColIdx);
    s.vertColIdx = clampPaletteIdx(s.vertColIdx);
    s.invVertColIdx = clampPaletteIdx(s.invVertColIdx);
    s.bgColIdx = clampPaletteIdx(s.bgColIdx);

    s.nIterations = std::clamp(s.nIterations, MIN_ITERATIONS, MAX_ITERATIONS);
    s.nSamples = std::clamp(s.nSamples, MIN_SAMPLES, MAX_SAMPLES);

    return s;
}

tilingSettings setCircularVertices(const tilingSettings& settings, bool enabled) {
    tilingSettings s = settings;
    s.doVerts = enabled;
    if (enabled)
        s.doOrns = false;
    else
        s.doInvVerts = false;

    return s;
}

tilingSettings setOrnamentedVertices(const tilingSettings& settings, bool enabled) {
    tilingSettings s = settings;
    s.doOrns = enabled;
    if (enabled)
        s.doVerts = false;
    else
        s.doInvVerts = false;

    return s;
}

tilingSettings setSolidColour(const tilingSettings& settings, bool enabled) {
    tilingSettings s = settings;
    s.doSolidColor = enabled;
    if (!enabled)
        s.doInvPol = false;

    return s;
}

tilingSettings setCheckerboard(const tilingSettings& settings, bool enabled) {
    tilingSettings s = settings;
    s.doInvPol = enabled;
    if (enabled)
        s.doSolidColor = true;

    return s;
}
