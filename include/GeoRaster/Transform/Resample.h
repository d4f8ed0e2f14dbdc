#pragma once

/**
 * @file Resample.h
 * @brief Area-average resampling of georeferenced rasters
 *
 * Each output cell is the mean of the input cells it covers, weighted by
 * the covered fraction of every input cell. NaN inputs do not contribute;
 * an output cell covering only NaN is NaN. The geotransform is rescaled
 * so that the output covers the same extent as the input.
 *
 * @code
 * RasterGrid half = ResampleAverage(dem, 0.5);      // 1000x800 -> 500x400
 * RasterGrid fixed = ResampleAverageSize(dem, 100, 80);
 * @endcode
 */

#include <GeoRaster/Core/RasterGrid.h>
#include <GeoRaster/Core/RasterStack.h>
#include <GeoRaster/Core/Types.h>
#include <GeoRaster/Platform/Thread.h>

namespace Geo::Raster::Transform {

/**
 * @brief Resampling parameters
 */
struct ResampleParams {
    double factor = 1.0;                            ///< Output size / input size, > 0
    const Platform::CancelToken* cancel = nullptr;  ///< Checked between output rows
};

/**
 * @brief Output shape for a scale factor
 * @return (max(1, floor(rows * factor)), max(1, floor(cols * factor)))
 * @throws InvalidArgumentException if factor is not positive and finite
 */
Shape2i ResampleShape(int32_t rows, int32_t cols, double factor);

/**
 * @brief Area-average resample to an explicit output size
 * @throws InvalidArgumentException if outRows or outCols is not positive
 */
RasterGrid ResampleAverageSize(const RasterGrid& image, int32_t outRows, int32_t outCols,
                               const Platform::CancelToken* cancel = nullptr);

/**
 * @brief Area-average resample by a scale factor
 * @return Resampled raster of ResampleShape(); empty for empty input
 */
RasterGrid ResampleAverage(const RasterGrid& image, const ResampleParams& params);

/**
 * @brief Area-average resample by a scale factor
 */
RasterGrid ResampleAverage(const RasterGrid& image, double factor);

/**
 * @brief Resample every band of a stack
 */
RasterStack ResampleAverage(const RasterStack& bands, const ResampleParams& params);

} // namespace Geo::Raster::Transform
