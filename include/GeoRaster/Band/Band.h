#pragma once

/**
 * @file Band.h
 * @brief Per-pixel band arithmetic
 *
 * Provides:
 * - Power / decibel conversion for SAR backscatter
 * - Normalized difference indices (NDVI, NDWI, GVI)
 * - Gap filling of NaN samples
 *
 * All functions return new rasters carrying the input georeference.
 */

#include <GeoRaster/Core/RasterGrid.h>
#include <GeoRaster/Core/RasterStack.h>
#include <GeoRaster/Core/Constants.h>

namespace Geo::Raster::Band {

/**
 * @brief Convert linear power to decibels: 10 * log10(v)
 *
 * Zero maps to -inf and negative values to NaN.
 */
RasterGrid NaturalToDb(const RasterGrid& image);

/**
 * @brief Convert decibels to linear power: 10^(v / 10)
 */
RasterGrid DbToNatural(const RasterGrid& image);

/**
 * @brief Normalized difference (a - b) / (a + b) * scale
 *
 * Pixels where a + b == 0 become NaN.
 *
 * @throws ShapeMismatchException if a and b differ in shape
 */
RasterGrid NormalizedDifference(const RasterGrid& a, const RasterGrid& b,
                                double scale = DEFAULT_INDEX_SCALE);

/**
 * @brief Append NDVI, NDWI and GVI bands to a copy of the stack
 * @param bands Stack of at least three bands (b0, b1, b2)
 * @param scale Index scale factor
 * @return Input bands followed by ND(b0,b1), ND(b2,b0), ND(b0,b2)
 *
 * @throws InsufficientDataException for fewer than three bands
 */
RasterStack AddIndices(const RasterStack& bands, double scale = DEFAULT_INDEX_SCALE);

/**
 * @brief Fill NaN samples by linear interpolation in row-major order
 *
 * Each NaN run is interpolated between the nearest finite samples before
 * and after it in the flattened raster. Runs at the start or end take the
 * nearest finite value.
 *
 * @return Filled copy (an unchanged copy if there is no NaN); empty for empty input
 * @throws InsufficientDataException if every sample is NaN
 */
RasterGrid FillNaNs(const RasterGrid& image);

} // namespace Geo::Raster::Band
