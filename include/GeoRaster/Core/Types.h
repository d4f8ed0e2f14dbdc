#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for GeoRaster
 */

#include <cstdint>
#include <GeoRaster/Core/Export.h>
#include <cmath>

namespace Geo::Raster {

// =============================================================================
// Point Types
// =============================================================================

/**
 * @brief 2D point in world (map) coordinates
 */
struct GEORASTER_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }
};

// =============================================================================
// Shape / Window Types
// =============================================================================

/**
 * @brief Grid dimensions in rows and columns
 */
struct GEORASTER_API Shape2i {
    int32_t rows = 0;
    int32_t cols = 0;

    Shape2i() = default;
    Shape2i(int32_t r, int32_t c) : rows(r), cols(c) {}

    int64_t Count() const { return static_cast<int64_t>(rows) * cols; }
    bool Empty() const { return rows <= 0 || cols <= 0; }

    bool operator==(const Shape2i& other) const {
        return rows == other.rows && cols == other.cols;
    }
    bool operator!=(const Shape2i& other) const { return !(*this == other); }
};

/**
 * @brief Window descriptor (height x width) for tiles and neighborhoods
 */
struct GEORASTER_API WindowSize {
    int32_t height = 0;
    int32_t width = 0;

    WindowSize() = default;
    WindowSize(int32_t h, int32_t w) : height(h), width(w) {}

    int64_t Area() const { return static_cast<int64_t>(height) * width; }
    bool IsPositive() const { return height > 0 && width > 0; }
    bool IsOdd() const { return (height % 2) != 0 && (width % 2) != 0; }

    /// Half extents of an odd window (radius per axis)
    int32_t HalfHeight() const { return height / 2; }
    int32_t HalfWidth() const { return width / 2; }
};

// =============================================================================
// Rectangle Types
// =============================================================================

/**
 * @brief Axis-aligned pixel rectangle (row/col origin, half-open extent)
 */
struct GEORASTER_API Rect2i {
    int32_t row = 0;    ///< Top
    int32_t col = 0;    ///< Left
    int32_t height = 0;
    int32_t width = 0;

    Rect2i() = default;
    Rect2i(int32_t row_, int32_t col_, int32_t h, int32_t w)
        : row(row_), col(col_), height(h), width(w) {}

    int32_t Bottom() const { return row + height; }
    int32_t Right() const { return col + width; }
    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    bool IsValid() const { return width >= 0 && height >= 0; }

    bool Contains(int32_t r, int32_t c) const {
        return r >= row && r < Bottom() && c >= col && c < Right();
    }
};

/**
 * @brief Georeferenced bounding box in world coordinates
 */
struct GEORASTER_API Extent2d {
    double left = 0.0;
    double bottom = 0.0;
    double right = 0.0;
    double top = 0.0;

    Extent2d() = default;
    Extent2d(double l, double b, double r, double t)
        : left(l), bottom(b), right(r), top(t) {}

    double Width() const { return right - left; }
    double Height() const { return top - bottom; }
    bool IsValid() const {
        return std::isfinite(left) && std::isfinite(bottom) &&
               std::isfinite(right) && std::isfinite(top) &&
               right >= left && top >= bottom;
    }
};

} // namespace Geo::Raster
