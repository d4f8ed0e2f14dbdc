#pragma once

/**
 * @file MajorityFilter.h
 * @brief Categorical majority (mode) filter
 *
 * Every output pixel is the most frequent value of the window centered
 * on it. The window is clipped at the raster border, so it shrinks
 * there instead of wrapping or padding. Two center rules bypass the vote:
 * - a missing center stays missing
 * - a center equal to the special category (1 by default) is kept
 *
 * Used to remove salt-and-pepper noise from classified land cover maps
 * without eroding no-data footprints or the protected category.
 *
 * @code
 * MajorityFilterParams params;
 * params.window = {5, 5};
 * RasterGrid smooth = MajorityFilter(classes, params);
 * @endcode
 */

#include <GeoRaster/Core/RasterGrid.h>
#include <GeoRaster/Core/RasterStack.h>
#include <GeoRaster/Core/Constants.h>
#include <GeoRaster/Core/Types.h>
#include <GeoRaster/Platform/Thread.h>

#include <optional>
#include <vector>

namespace Geo::Raster::Filter {

/**
 * @brief Majority filter parameters
 */
struct MajorityFilterParams {
    WindowSize window{3, 3};                            ///< Odd height x width
    double specialValue = DEFAULT_SPECIAL_CATEGORY;     ///< Category never replaced
    bool preserveSpecial = true;                        ///< Enable the special category rule
    std::optional<double> noDataValue;                  ///< Extra missing marker besides NaN
    const Platform::CancelToken* cancel = nullptr;      ///< Checked between rows
};

/**
 * @brief Check whether a sample is missing (NaN or the nodata value)
 */
bool IsMissing(double value, const MajorityFilterParams& params);

/**
 * @brief Clamped neighborhood window of pixel (row, col)
 *
 * Rows [row - h/2, row + h/2] and columns [col - w/2, col + w/2]
 * intersected with the raster.
 */
Rect2i NeighborhoodWindow(int32_t row, int32_t col, const WindowSize& window,
                          int32_t rows, int32_t cols);

/**
 * @brief Majority value of a neighborhood
 * @param values Neighborhood samples (reordered)
 * @return Most frequent value; smallest value on ties, NaN after every number
 */
double MajorityValue(std::vector<double>& values);

/**
 * @brief Apply the majority filter
 * @param image Categorical raster (NaN = missing)
 * @param params Filter parameters
 * @return Raster of the input shape with the same georeference; empty for empty input
 *
 * Missing samples in a window take part in the vote; a numeric nodata
 * value counts as its own category, all NaN samples as one category.
 *
 * @throws InvalidWindowException if the window is not positive and odd
 * @throws CancelledException if params.cancel is set during the run
 */
RasterGrid MajorityFilter(const RasterGrid& image,
                          const MajorityFilterParams& params = MajorityFilterParams());

/**
 * @brief Apply the majority filter with default rules and the given window
 */
RasterGrid MajorityFilter(const RasterGrid& image, const WindowSize& window);

/**
 * @brief Apply the majority filter to every band of a stack
 */
RasterStack MajorityFilter(const RasterStack& bands,
                           const MajorityFilterParams& params = MajorityFilterParams());

} // namespace Geo::Raster::Filter
