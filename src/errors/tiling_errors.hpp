#ifndef TILING_ERRORS_H
#define TILING_ERRORS_H

#include <stdexcept>
#include <string>

// Raised for a Schlafli symbol or edge thickness that does not describe a hyperbolic tiling
class InvalidTilingError : public std::invalid_argument {
    public:
        explicit InvalidTilingError(const std::string& what) : std::invalid_argument(what) {}
};

// Raised when a construction step meets collinear points, a missing intersection or a zero denominator
class DegenerateGeometryError : public std::runtime_error {
    public:
        explicit DegenerateGeometryError(const std::string& what) : std::runtime_error(what) {}
};

#endif
