#include <GeoRaster/Core/GeoTransform.h>
#include <GeoRaster/Core/Constants.h>
#include <GeoRaster/Core/Exception.h>

#include <algorithm>
#include <cmath>

namespace Geo::Raster {

// =============================================================================
// Constructors
// =============================================================================

GeoTransform::GeoTransform() : m_{1.0, 0.0, 0.0, 0.0, 1.0, 0.0} {}

GeoTransform::GeoTransform(double a, double b, double c,
                           double d, double e, double f)
    : m_{a, b, c, d, e, f} {}

GeoTransform GeoTransform::FromOrigin(double originX, double originY,
                                      double pixelWidth, double pixelHeight) {
    if (!(pixelWidth > 0.0) || !(pixelHeight > 0.0)) {
        throw InvalidArgumentException("GeoTransform::FromOrigin: pixel size must be > 0");
    }
    return GeoTransform(pixelWidth, 0.0, originX, 0.0, -pixelHeight, originY);
}

// =============================================================================
// Operations
// =============================================================================

GeoTransform GeoTransform::operator*(const GeoTransform& other) const {
    const auto& o = other.m_;
    return GeoTransform(
        m_[0] * o[0] + m_[1] * o[3],
        m_[0] * o[1] + m_[1] * o[4],
        m_[0] * o[2] + m_[1] * o[5] + m_[2],
        m_[3] * o[0] + m_[4] * o[3],
        m_[3] * o[1] + m_[4] * o[4],
        m_[3] * o[2] + m_[4] * o[5] + m_[5]);
}

bool GeoTransform::operator==(const GeoTransform& other) const {
    for (int i = 0; i < 6; ++i) {
        if (!ApproxEqual(m_[i], other.m_[i])) {
            return false;
        }
    }
    return true;
}

bool GeoTransform::operator!=(const GeoTransform& other) const {
    return !(*this == other);
}

double GeoTransform::Determinant() const {
    return m_[0] * m_[4] - m_[1] * m_[3];
}

bool GeoTransform::IsInvertible() const {
    double det = Determinant();
    return std::isfinite(det) && std::abs(det) > 0.0;
}

GeoTransform GeoTransform::Inverse() const {
    if (!IsInvertible()) {
        throw InvalidArgumentException("GeoTransform::Inverse: transform is singular");
    }

    double invDet = 1.0 / Determinant();

    // | e/det  -b/det  (b*f - c*e)/det |
    // | -d/det  a/det  (c*d - a*f)/det |
    return GeoTransform(
        m_[4] * invDet,
        -m_[1] * invDet,
        (m_[1] * m_[5] - m_[2] * m_[4]) * invDet,
        -m_[3] * invDet,
        m_[0] * invDet,
        (m_[2] * m_[3] - m_[0] * m_[5]) * invDet);
}

GeoTransform GeoTransform::Scaled(double sx, double sy) const {
    if (!std::isfinite(sx) || !std::isfinite(sy) || sx <= 0.0 || sy <= 0.0) {
        throw InvalidArgumentException("GeoTransform::Scaled: scale factors must be > 0");
    }
    return *this * GeoTransform(sx, 0.0, 0.0, 0.0, sy, 0.0);
}

// =============================================================================
// Point Mapping
// =============================================================================

Point2d GeoTransform::PixelToWorld(double col, double row) const {
    return {m_[0] * col + m_[1] * row + m_[2],
            m_[3] * col + m_[4] * row + m_[5]};
}

Point2d GeoTransform::PixelCenter(int32_t col, int32_t row) const {
    return PixelToWorld(col + 0.5, row + 0.5);
}

Point2d GeoTransform::WorldToPixel(double x, double y) const {
    return Inverse().PixelToWorld(x, y);
}

Extent2d GeoTransform::ExtentOf(int32_t rows, int32_t cols) const {
    if (rows < 0 || cols < 0) {
        throw InvalidArgumentException("GeoTransform::ExtentOf: shape must be >= 0");
    }
    const Point2d corners[4] = {
        PixelToWorld(0.0, 0.0),
        PixelToWorld(cols, 0.0),
        PixelToWorld(cols, rows),
        PixelToWorld(0.0, rows)
    };

    Extent2d ext(corners[0].x, corners[0].y, corners[0].x, corners[0].y);
    for (const auto& p : corners) {
        ext.left = std::min(ext.left, p.x);
        ext.right = std::max(ext.right, p.x);
        ext.bottom = std::min(ext.bottom, p.y);
        ext.top = std::max(ext.top, p.y);
    }
    return ext;
}

// =============================================================================
// Element Access
// =============================================================================

double GeoTransform::PixelWidth() const {
    return std::sqrt(m_[0] * m_[0] + m_[3] * m_[3]);
}

double GeoTransform::PixelHeight() const {
    return std::sqrt(m_[1] * m_[1] + m_[4] * m_[4]);
}

bool GeoTransform::IsIdentity() const {
    return ApproxEqual(m_[0], 1.0) && ApproxEqual(m_[1], 0.0) &&
           ApproxEqual(m_[2], 0.0) && ApproxEqual(m_[3], 0.0) &&
           ApproxEqual(m_[4], 1.0) && ApproxEqual(m_[5], 0.0);
}

} // namespace Geo::Raster
