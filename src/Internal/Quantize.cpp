/**
 * @file Quantize.cpp
 * @brief Gray level quantization of raster tiles
 */

#include <GeoRaster/Internal/Quantize.h>
#include <GeoRaster/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Geo::Raster::Internal {

double RoundHalfEven(double value) {
    double rounded = std::round(value);   // ties away from zero
    if (std::abs(value - std::trunc(value)) == 0.5) {
        rounded = 2.0 * std::round(value / 2.0);
    }
    return rounded;
}

void CopyWindow(const RasterGrid& image, const Rect2i& rect, std::vector<double>& scratch) {
    if (rect.row < 0 || rect.col < 0 || rect.height < 0 || rect.width < 0 ||
        rect.Bottom() > image.Rows() || rect.Right() > image.Cols()) {
        throw OutOfRangeException("CopyWindow: window outside raster");
    }

    scratch.resize(static_cast<size_t>(rect.Area()));
    double* dst = scratch.data();
    for (int32_t r = rect.row; r < rect.Bottom(); ++r) {
        const double* src = image.RowPtr(r) + rect.col;
        dst = std::copy(src, src + rect.width, dst);
    }
}

QuantizeStatus QuantizeScratch(std::vector<double>& scratch, int32_t rows, int32_t cols,
                               int32_t numLevels, QuantizedTile& tile) {
    tile.rows = rows;
    tile.cols = cols;
    tile.numLevels = numLevels;
    tile.levels.assign(scratch.size(), MISSING_LEVEL);

    double maxVal = -std::numeric_limits<double>::infinity();
    bool anyFinite = false;
    for (double v : scratch) {
        if (std::isfinite(v)) {
            maxVal = std::max(maxVal, v);
            anyFinite = true;
        }
    }
    if (!anyFinite || maxVal == 0.0) {
        return QuantizeStatus::Degenerate;
    }

    const double scale = (numLevels - 1) / maxVal;
    const double top = numLevels - 1;
    for (size_t i = 0; i < scratch.size(); ++i) {
        double v = scratch[i];
        if (std::isnan(v)) {
            continue;
        }
        v = RoundHalfEven(v * scale);
        scratch[i] = std::clamp(v, 0.0, top);
        tile.levels[i] = static_cast<int32_t>(scratch[i]);
    }
    return QuantizeStatus::Ok;
}

QuantizeStatus QuantizeTile(const RasterGrid& image, const Rect2i& rect, int32_t numLevels,
                            std::vector<double>& scratch, QuantizedTile& tile) {
    CopyWindow(image, rect, scratch);
    return QuantizeScratch(scratch, rect.height, rect.width, numLevels, tile);
}

} // namespace Geo::Raster::Internal
