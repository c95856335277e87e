#include <algorithm>
#include <cmath>

#include "classifier.hpp"
#include "../geometry/geometry.hpp"
#include "../models/models.hpp"

static double dot(const Complex& z, const Complex& w) {
    return z.real() * w.real() + z.imag() * w.imag();
}

Complex screenToView(double px, double py, double width, double height) {
    double scale = std::min(width, height);
    return Complex((2.0 * px - width) / scale, (height - 2.0 * py) / scale);
}

Complex recentre(const Complex& z, const Complex& offset) {
    return (z - offset) / (CMP_ONE - Complex::conj(offset) * z);
}

reductionResult reduceToFundamentalDomain(Complex z, const tilingDescriptor& desc, unsigned int maxIterations) {
    reductionResult result{ z, 0, 0, 0, false };
    double invRadSq = desc.invRad * desc.invRad;

    for (unsigned int i = 0; i < maxIterations; i++) {
        bool changed = false;

        // Invert in the circle through edge V1V2
        Complex fromCen = result.z - desc.invCen;
        double distSq = Complex::magSq(fromCen);
        if (distSq < invRadSq) {
            result.z = desc.invCen + fromCen * (invRadSq / distSq);
            result.reflections++;
            result.inversions++;
            changed = true;
        }

        // Reflect in the line through edge V2V0
        double side = dot(result.z, desc.refNrm);
        if (side < 0.0) {
            result.z -= desc.refNrm * (2.0 * side);
            result.reflections++;
            changed = true;
        }

        // Reflect in the real axis, edge V0V1
        if (result.z.imag() < 0.0) {
            result.z = Complex::conj(result.z);
            result.reflections++;
            changed = true;
        }

        result.iterations = i + 1;
        if (!changed) {
            result.converged = true;
            break;
        }
    }

    return result;
}

bool inOrnament(const Complex& z, const tilingDescriptor& desc) {
    return isInsideTriangle(z, desc.V0, desc.D, desc.E) ||
        isInsideTriangle(z, desc.V1, desc.D1, desc.E1) ||
        isInsideTriangle(z, desc.V1, desc.D1p, desc.E1p) ||
        isInsideTriangle(z, desc.V2, desc.D2, desc.E2);
}

bool inVertexCircle(const Complex& z, const tilingDescriptor& desc, const tilingSettings& settings) {
    bool e01 = settings.doV0V1;
    bool e12 = settings.doV1V2;
    bool e20 = settings.doV2V0;

    // Bare vertices when no edge is chosen
    if (!e01 && !e12 && !e20)
        return isInsideCircle(z, desc.triV0Enlarged) ||
            isInsideCircle(z, desc.triV1Enlarged) ||
            isInsideCircle(z, desc.triV2Enlarged);

    if (e01 || e20) {
        const circle& atV0 = (e01 && !e20) ? desc.V0Enlarged : desc.triV0Enlarged;
        if (isInsideCircle(z, atV0))
            return true;
    }

    // Edges through V1 meet at right angles, a single edge runs straight through it
    if (e01 && e12 && isInsideCircle(z, desc.triV1Enlarged))
        return true;

    if (e12 || e20) {
        const circle& atV2 = (e12 && !e20) ? desc.V2Enlarged : desc.triV2Enlarged;
        if (isInsideCircle(z, atV2))
            return true;
    }

    return false;
}

bool onEdge(const Complex& z, const tilingDescriptor& desc, const tilingSettings& settings) {
    if (settings.preciseEdges) {
        return (settings.doV0V1 && isInsideCircle(z, desc.thickEdge01)) ||
            (settings.doV1V2 && isInsideCircle(z, desc.thickEdge12)) ||
            (settings.doV2V0 && isInsideCircle(z, desc.thickEdge20));
    }

    // Euclidean bands of the same width
    double t = desc.edgeThickness;
    return (settings.doV0V1 && z.imag() < t) ||
        (settings.doV1V2 && Complex::mag(z - desc.invCen) - desc.invRad < t) ||
        (settings.doV2V0 && dot(z, desc.refNrm) < t);
}

static colour ringColour(double u, double fraction, unsigned int repeats, bool reversed, const tilingSettings& settings) {
    colour centre = paletteColour(settings.polygonColIdx);
    if (!(u > settings.centerCutoff))
        return centre;

    double layer = std::max(0.0, -std::log(u) / settings.expRatioRings);
    if (layer >= settings.ringLayerNum)
        return centre;

    // Neighbouring rings are offset by half a pattern
    unsigned int ring = static_cast<unsigned int>(layer);
    double phase = fraction * repeats + (ring % 2) * 0.5;
    phase -= std::floor(phase);

    unsigned int cell = std::min(3u, static_cast<unsigned int>(phase * 4.0));
    if (reversed)
        cell = 3 - cell;

    return SNAKE_COLOURS[cell];
}

colour snakeColour(const Complex& z, bool oddParity, const tilingDescriptor& desc, const tilingSettings& settings) {
    // Mirrored copies run the pattern backwards so the whole ring turns one way
    double frontRadius = Complex::mag(desc.V1);
    double rz = Complex::mag(z);
    if (rz <= frontRadius) {
        double fraction = Complex::arg(z) / Complex::arg(desc.V2);
        return ringColour(rz / frontRadius, fraction, settings.nRepeatPerSectV0, settings.doForeRev != oddParity, settings);
    }

    const circle& back = desc.C2RotSnakes;
    Complex fromCen = z - back.center;
    double rw = Complex::mag(fromCen);
    if (rw <= back.radius) {
        double fraction = std::fabs(Complex::arg(fromCen / (desc.V1 - back.center))) / (M_PI / desc.q);
        return ringColour(rw / back.radius, fraction, settings.nRepeatPerSectV2, settings.doBackRev != oddParity, settings);
    }

    return paletteColour(settings.polygonColIdx);
}

static colour polygonFill(const reductionResult& reduced, bool oddParity, const tilingSettings& settings) {
    colour fill = paletteColour(settings.polygonColIdx);

    if (!settings.doSolidColor)
        fill = colourGradient(reduced.inversions, settings.nIterations);
    else if (settings.doInvPol && reduced.inversions % 2 == 1)
        fill = paletteColour(settings.invPolygonColIdx);

    if (settings.doParity && oddParity)
        fill = colourLerp(fill, BLACK, PARITY_SHADE);

    return fill;
}

classification classifyPoint(const Complex& viewPos, const frameSnapshot& frame) {
    const tilingSettings& settings = frame.settings;
    const tilingDescriptor& desc = frame.descriptor;

    Complex z = applyModel(settings.modelIdx, viewPos);
    if (!(Complex::magSq(z) < 1.0))
        return { tileFeature::Background, paletteColour(settings.bgColIdx) };

    z = recentre(z, frame.panOffset);
    reductionResult reduced = reduceToFundamentalDomain(z, desc, settings.nIterations);

    bool oddParity = reduced.reflections % 2 == 1;
    colour vertexCol = (settings.doInvVerts && oddParity)
        ? paletteColour(settings.invVertColIdx)
        : paletteColour(settings.vertColIdx);

    if (settings.doOrns && inOrnament(reduced.z, desc))
        return { tileFeature::Ornament, vertexCol };

    if (settings.doVerts && inVertexCircle(reduced.z, desc, settings))
        return { tileFeature::Vertex, vertexCol };

    if (settings.doEdges && onEdge(reduced.z, desc, settings))
        return { tileFeature::Edge, paletteColour(settings.edgeColIdx) };

    if (settings.doSnake)
        return { tileFeature::Snake, snakeColour(reduced.z, oddParity, desc, settings) };

    return { tileFeature::Polygon, polygonFill(reduced, oddParity, settings) };
}

colour shadePixel(unsigned int px, unsigned int py, unsigned int width, unsigned int height, const frameSnapshot& frame) {
    return shadePixel(px, py, width, height, frame, frame.settings.nSamples);
}

colour shadePixel(unsigned int px, unsigned int py, unsigned int width, unsigned int height, const frameSnapshot& frame, unsigned int nSamples) {
    if (nSamples == 0)
        nSamples = 1;

    double step = 1.0 / nSamples;
    unsigned long r = 0, g = 0, b = 0;

    for (unsigned int i = 0; i < nSamples; i++) {
        for (unsigned int j = 0; j < nSamples; j++) {
            Complex viewPos = screenToView(px + (i + 0.5) * step, py + (j + 0.5) * step, width, height);
            colour col = classifyPoint(viewPos, frame).col;
            r += col.r;
            g += col.g;
            b += col.b;
        }
    }

    unsigned long count = static_cast<unsigned long>(nSamples) * nSamples;
    return colour{
        static_cast<unsigned char>((r + count / 2) / count),
        static_cast<unsigned char>((g + count / 2) / count),
        static_cast<unsigned char>((b + count / 2) / count),
    };
}
