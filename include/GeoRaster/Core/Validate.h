#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for GeoRaster
 *
 * Design principles:
 * - Empty raster returns false (not an error), invalid throws
 * - Window checks raise InvalidWindowException, shape checks ShapeMismatchException
 * - Consistent error message format: "<function>: <what> must be <rule>, got <value>"
 */

#include <GeoRaster/Core/Export.h>
#include <GeoRaster/Core/Exception.h>
#include <GeoRaster/Core/RasterGrid.h>
#include <GeoRaster/Core/RasterStack.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Geo::Raster::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatShape(const Shape2i& shape) {
    return std::to_string(shape.rows) + "x" + std::to_string(shape.cols);
}

inline std::string FormatWindow(const WindowSize& window) {
    return std::to_string(window.height) + "x" + std::to_string(window.width);
}

} // namespace Detail

// =============================================================================
// Raster Validation
// =============================================================================

/**
 * @brief Check raster is allocated and valid
 *
 * Use this when an empty raster should be a silent no-op.
 *
 * @return false if empty (caller should return empty result)
 * @throws InvalidArgumentException if the raster is corrupted
 */
inline bool RequireRasterValid(const RasterGrid& raster, const char* funcName) {
    if (raster.Empty()) {
        return false;
    }
    if (!raster.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": raster is invalid");
    }
    return true;
}

/**
 * @brief Check two rasters have identical shapes
 * @throws ShapeMismatchException
 */
inline void RequireSameShape(const RasterGrid& a, const RasterGrid& b, const char* funcName) {
    if (!a.SameShape(b)) {
        throw ShapeMismatchException(
            std::string(funcName) + ": " + Detail::FormatShape(a.Shape()) +
            " vs " + Detail::FormatShape(b.Shape()));
    }
}

/**
 * @brief Check a shape against the expected one
 * @throws ShapeMismatchException
 */
inline void RequireShape(const Shape2i& actual, const Shape2i& expected, const char* funcName) {
    if (actual != expected) {
        throw ShapeMismatchException(
            std::string(funcName) + ": expected " + Detail::FormatShape(expected) +
            ", got " + Detail::FormatShape(actual));
    }
}

/**
 * @brief Check stack has at least the given number of bands
 * @throws InsufficientDataException
 */
inline void RequireBandCount(const RasterStack& stack, size_t minBands, const char* funcName) {
    if (stack.BandCount() < minBands) {
        throw InsufficientDataException(
            std::string(funcName) + ": need at least " + std::to_string(minBands) +
            " bands, got " + std::to_string(stack.BandCount()));
    }
}

// =============================================================================
// Window Validation
// =============================================================================

/**
 * @brief Check both window dimensions are positive
 * @throws InvalidWindowException
 */
inline void RequireWindow(const WindowSize& window, const char* funcName) {
    if (!window.IsPositive()) {
        throw InvalidWindowException(
            std::string(funcName) + ": window must be > 0 in both dimensions, got " +
            Detail::FormatWindow(window));
    }
}

/**
 * @brief Check window is positive and odd in both dimensions
 *
 * Odd sizes give an unambiguous center pixel.
 *
 * @throws InvalidWindowException
 */
inline void RequireOddWindow(const WindowSize& window, const char* funcName) {
    RequireWindow(window, funcName);
    if (!window.IsOdd()) {
        throw InvalidWindowException(
            std::string(funcName) + ": window must be odd in both dimensions, got " +
            Detail::FormatWindow(window));
    }
}

// =============================================================================
// Value Range Validation
// =============================================================================

/**
 * @brief Validate value is in range [min, max]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (value < minVal || value > maxVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is positive (> 0); NaN is rejected
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (!(value > T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is finite
 */
inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite, got " +
            Detail::FormatValue(value));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

/// Return an empty result from the enclosing function when the raster is empty
#define GEORASTER_REQUIRE_RASTER(raster) \
    if (!::Geo::Raster::Validate::RequireRasterValid(raster, __func__)) return {}

} // namespace Geo::Raster::Validate
