#pragma once

/**
 * @file GeoTransform.h
 * @brief Affine pixel-to-world transform for georeferenced rasters
 *
 * Maps a pixel corner (col, row) to world coordinates:
 *   x = a*col + b*row + c
 *   y = d*col + e*row + f
 *
 * North-up rasters have b = d = 0 and e < 0 (y decreases downwards).
 * Coefficient order follows the common (a, b, c, d, e, f) affine layout.
 */

#include <GeoRaster/Core/Types.h>
#include <GeoRaster/Core/Export.h>

#include <array>

namespace Geo::Raster {

class GEORASTER_API GeoTransform {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Identity transform (pixel coordinates == world coordinates)
    GeoTransform();

    /// Construct from the six affine coefficients
    GeoTransform(double a, double b, double c,
                 double d, double e, double f);

    /// North-up transform from the upper-left corner and pixel size
    static GeoTransform FromOrigin(double originX, double originY,
                                   double pixelWidth, double pixelHeight);

    // =========================================================================
    // Operations
    // =========================================================================

    /// Composition: this * other (apply other first)
    GeoTransform operator*(const GeoTransform& other) const;

    bool operator==(const GeoTransform& other) const;
    bool operator!=(const GeoTransform& other) const;

    /// Determinant of the linear part (a*e - b*d)
    double Determinant() const;

    bool IsInvertible() const;

    /// Inverse transform
    /// @throws InvalidArgumentException if the transform is singular
    GeoTransform Inverse() const;

    /**
     * @brief Transform with pixel size scaled by (sx, sy)
     *
     * Used after resampling: an output pixel spans sx input columns and
     * sy input rows, the origin is unchanged.
     */
    GeoTransform Scaled(double sx, double sy) const;

    // =========================================================================
    // Point Mapping
    // =========================================================================

    /// World coordinates of the pixel corner (col, row)
    Point2d PixelToWorld(double col, double row) const;

    /// World coordinates of the center of pixel (col, row)
    Point2d PixelCenter(int32_t col, int32_t row) const;

    /// Fractional pixel coordinates (x = col, y = row) of a world point
    Point2d WorldToPixel(double x, double y) const;

    /// World bounding box of a raster with the given shape
    Extent2d ExtentOf(int32_t rows, int32_t cols) const;

    // =========================================================================
    // Element Access
    // =========================================================================

    double A() const { return m_[0]; }
    double B() const { return m_[1]; }
    double C() const { return m_[2]; }
    double D() const { return m_[3]; }
    double E() const { return m_[4]; }
    double F() const { return m_[5]; }

    /// Pixel width in world units (|a| for north-up rasters)
    double PixelWidth() const;

    /// Pixel height in world units (|e| for north-up rasters)
    double PixelHeight() const;

    bool IsNorthUp() const { return m_[1] == 0.0 && m_[3] == 0.0; }
    bool IsIdentity() const;

private:
    // Storage: [a, b, c, d, e, f]
    std::array<double, 6> m_;
};

} // namespace Geo::Raster
