#pragma once

/**
 * @file Constants.h
 * @brief Numeric constants and tolerance helpers
 */

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Geo::Raster {

/// Relative tolerance for floating point comparisons
constexpr double EPSILON = 1e-12;

/// Default number of gray levels for texture quantization
constexpr int32_t DEFAULT_GRAY_LEVELS = 32;

/// Supported gray level range for texture quantization
constexpr int32_t MIN_GRAY_LEVELS = 2;
constexpr int32_t MAX_GRAY_LEVELS = 256;

/// Category left untouched by the majority filter (open water in land cover maps)
constexpr double DEFAULT_SPECIAL_CATEGORY = 1.0;

/// Scale factor applied to normalized difference band indices
constexpr double DEFAULT_INDEX_SCALE = 1000.0;

/// Compare with a tolerance relative to the operands' magnitude
inline bool ApproxEqual(double a, double b, double tol = EPSILON) {
    double scale = std::max(1.0, std::max(std::abs(a), std::abs(b)));
    return std::abs(a - b) <= tol * scale;
}

} // namespace Geo::Raster
