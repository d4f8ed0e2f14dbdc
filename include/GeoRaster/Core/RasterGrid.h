#pragma once

/**
 * @file RasterGrid.h
 * @brief Dense single-band raster with optional georeferencing
 */

#include <GeoRaster/Core/Types.h>
#include <GeoRaster/Core/GeoTransform.h>
#include <GeoRaster/Core/Export.h>

#include <memory>
#include <string>
#include <vector>

namespace Geo::Raster {

/**
 * @brief Single-band raster grid of double samples
 *
 * Key features:
 * - Row-major storage, row 0 is the top row, column 0 the leftmost
 * - Categorical rasters use the same type; NaN marks missing samples
 * - Optional affine geotransform and CRS tag carried along with the data
 * - Shallow copy by default, Clone() for deep copy
 */
class GEORASTER_API RasterGrid {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty raster)
    RasterGrid();

    /// Create raster with the given shape, every sample set to fill
    RasterGrid(int32_t rows, int32_t cols, double fill = 0.0);

    /// Copy constructor (shallow copy)
    RasterGrid(const RasterGrid& other);

    /// Move constructor
    RasterGrid(RasterGrid&& other) noexcept;

    ~RasterGrid();

    /// Copy assignment (shallow copy)
    RasterGrid& operator=(const RasterGrid& other);

    /// Move assignment
    RasterGrid& operator=(RasterGrid&& other) noexcept;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Create from a row-major buffer (copies data)
    static RasterGrid FromData(const double* data, int32_t rows, int32_t cols);

    /**
     * @brief Create from a row-major vector (copies data)
     * @throws ShapeMismatchException if values.size() != rows * cols
     */
    static RasterGrid FromVector(const std::vector<double>& values,
                                 int32_t rows, int32_t cols);

    /// Create from nested rows; all rows must have the same length
    static RasterGrid FromRows(const std::vector<std::vector<double>>& rows);

    // =========================================================================
    // Basic Properties
    // =========================================================================

    int32_t Rows() const;
    int32_t Cols() const;
    Shape2i Shape() const;

    /// Number of samples (rows * cols)
    int64_t Count() const;

    /// Check if raster is empty
    bool Empty() const;

    /// Check if raster is valid (allocated and non-empty)
    bool IsValid() const;

    /// True if both rasters have the same shape
    bool SameShape(const RasterGrid& other) const;

    // =========================================================================
    // Data Access
    // =========================================================================

    double* Data();
    const double* Data() const;

    double* RowPtr(int32_t row);
    const double* RowPtr(int32_t row) const;

    /// Sample at (row, col), bounds checked
    double At(int32_t row, int32_t col) const;

    /// Set sample at (row, col), bounds checked
    void SetAt(int32_t row, int32_t col, double value);

    void Fill(double value);

    /// True if any sample is NaN
    bool HasNaN() const;

    /// Row-major copy of the samples
    std::vector<double> ToVector() const;

    // =========================================================================
    // Raster Operations
    // =========================================================================

    /// Deep copy (data and georeferencing)
    RasterGrid Clone() const;

    /**
     * @brief Deep copy of a rectangular window
     *
     * The window is clipped to the raster. The result keeps the CRS and
     * a geotransform shifted to the window origin.
     */
    RasterGrid Crop(const Rect2i& rect) const;

    // =========================================================================
    // Georeferencing
    // =========================================================================

    bool HasGeoTransform() const;
    const GeoTransform& GetGeoTransform() const;
    void SetGeoTransform(const GeoTransform& transform);
    void ClearGeoTransform();

    /// Coordinate reference system tag (empty if unknown)
    const std::string& Crs() const;
    void SetCrs(const std::string& crs);

    /// Copy geotransform and CRS from another raster
    void CopyGeoreference(const RasterGrid& other);

    /// World extent; identity transform if none is set
    Extent2d Extent() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace Geo::Raster
