#pragma once

/**
 * @file Quantize.h
 * @brief Gray level quantization of raster tiles
 *
 * A tile is copied into a scratch buffer and rescaled by (levels-1)/max,
 * then rounded half-to-even and clamped to [0, levels-1]. The source
 * raster is never written to.
 */

#include <GeoRaster/Core/RasterGrid.h>
#include <GeoRaster/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Geo::Raster::Internal {

/// Level assigned to missing (NaN) samples; excluded from co-occurrence pairs
constexpr int32_t MISSING_LEVEL = -1;

/**
 * @brief Quantized tile (row-major levels)
 */
struct QuantizedTile {
    int32_t rows = 0;
    int32_t cols = 0;
    int32_t numLevels = 0;
    std::vector<int32_t> levels;

    int32_t At(int32_t r, int32_t c) const { return levels[static_cast<size_t>(r) * cols + c]; }
    bool Empty() const { return rows == 0 || cols == 0; }
};

/**
 * @brief Outcome of quantizing one tile
 */
enum class QuantizeStatus {
    Ok,
    Degenerate      ///< Maximum is zero or there is no finite sample
};

/**
 * @brief Round to nearest integer, ties to even (0.5 -> 0, 1.5 -> 2, 2.5 -> 2)
 *
 * Independent of the floating point rounding mode.
 */
double RoundHalfEven(double value);

/**
 * @brief Copy a window of the raster into a scratch buffer
 * @param image Source raster
 * @param rect Window, must lie inside the raster
 * @param scratch Output buffer, resized to rect.Area()
 */
void CopyWindow(const RasterGrid& image, const Rect2i& rect, std::vector<double>& scratch);

/**
 * @brief Quantize scratch samples into gray levels
 * @param scratch Tile samples (row-major), rescaled in place
 * @param rows Tile rows
 * @param cols Tile columns
 * @param numLevels Number of gray levels (>= 2)
 * @param tile Output quantized tile
 * @return Degenerate if the maximum finite sample is zero or no sample is finite
 *
 * NaN samples map to MISSING_LEVEL.
 */
QuantizeStatus QuantizeScratch(std::vector<double>& scratch, int32_t rows, int32_t cols,
                               int32_t numLevels, QuantizedTile& tile);

/**
 * @brief Copy and quantize one tile of a raster
 */
QuantizeStatus QuantizeTile(const RasterGrid& image, const Rect2i& rect, int32_t numLevels,
                            std::vector<double>& scratch, QuantizedTile& tile);

} // namespace Geo::Raster::Internal
