#ifndef PRESETS_H
#define PRESETS_H

#include <string>

#include "../settings/settings.hpp"

enum class presetKind {
    Default,
    RotatingSnakes,
    PrimroseField,
    ScintillatingGrid,
    HermannGrid,
};

const presetKind ILLUSION_PRESETS[] = {
    presetKind::PrimroseField,
    presetKind::ScintillatingGrid,
    presetKind::HermannGrid,
};

// Builds complete settings from the defaults. Only Default and RotatingSnakes take edgeThickness,
// the other illusions fix their own.
tilingSettings makePreset(presetKind kind, double edgeThickness = INITIAL_EDGE_THICKNESS);

std::string presetName(presetKind kind);

// The rotating snakes toggle, either way: resets to {5, 5} in the disk with solid colours and no parity.
// Turning it on hides edges, vertices, ornaments and the checkerboard; turning it off brings the edges back.
tilingSettings setRotatingSnakes(const tilingSettings& settings, bool enabled);

#endif
