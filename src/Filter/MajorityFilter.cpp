/**
 * @file MajorityFilter.cpp
 * @brief Categorical majority filter implementation
 */

#include <GeoRaster/Filter/MajorityFilter.h>
#include <GeoRaster/Core/Exception.h>
#include <GeoRaster/Core/Validate.h>
#include <GeoRaster/Internal/MajorityVote.h>
#include <GeoRaster/Platform/Log.h>

#include <algorithm>
#include <cmath>

namespace Geo::Raster::Filter {

bool IsMissing(double value, const MajorityFilterParams& params) {
    return std::isnan(value) || (params.noDataValue && value == *params.noDataValue);
}

Rect2i NeighborhoodWindow(int32_t row, int32_t col, const WindowSize& window,
                          int32_t rows, int32_t cols) {
    const int32_t halfH = window.HalfHeight();
    const int32_t halfW = window.HalfWidth();

    const int32_t minY = std::max(0, row - halfH);
    const int32_t maxY = std::min(rows - 1, row + halfH);
    const int32_t minX = std::max(0, col - halfW);
    const int32_t maxX = std::min(cols - 1, col + halfW);
    return {minY, minX, maxY - minY + 1, maxX - minX + 1};
}

double MajorityValue(std::vector<double>& values) {
    return Internal::MajorityVote(values);
}

RasterGrid MajorityFilter(const RasterGrid& image, const MajorityFilterParams& params) {
    Validate::RequireOddWindow(params.window, "MajorityFilter");
    if (!Validate::RequireRasterValid(image, "MajorityFilter")) {
        return RasterGrid();
    }

    const int32_t h = image.Rows();
    const int32_t w = image.Cols();

    Platform::Logger()->debug("MajorityFilter: {}x{} raster, {}x{} window", h, w,
                              params.window.height, params.window.width);

    RasterGrid output(h, w);
    output.CopyGeoreference(image);

    Platform::ParallelFor(0, static_cast<size_t>(h), [&](size_t rowIdx) {
        const int32_t y = static_cast<int32_t>(rowIdx);
        const double* srcRow = image.RowPtr(y);
        double* dstRow = output.RowPtr(y);
        std::vector<double> neighborhood;
        // Clamped window never exceeds the raster
        neighborhood.reserve(static_cast<size_t>(
            std::min<int64_t>(params.window.height, h) *
            std::min<int64_t>(params.window.width, w)));

        for (int32_t x = 0; x < w; ++x) {
            const double center = srcRow[x];
            if (IsMissing(center, params)) {
                dstRow[x] = center;
                continue;
            }
            if (params.preserveSpecial && center == params.specialValue) {
                dstRow[x] = center;
                continue;
            }

            const Rect2i win = NeighborhoodWindow(y, x, params.window, h, w);
            neighborhood.clear();
            for (int32_t sy = win.row; sy < win.Bottom(); ++sy) {
                const double* src = image.RowPtr(sy);
                neighborhood.insert(neighborhood.end(), src + win.col, src + win.Right());
            }
            dstRow[x] = Internal::MajorityVote(neighborhood);
        }
    }, 0, params.cancel);

    // Internal consistency
    Validate::RequireShape(output.Shape(), image.Shape(), "MajorityFilter");
    return output;
}

RasterGrid MajorityFilter(const RasterGrid& image, const WindowSize& window) {
    MajorityFilterParams params;
    params.window = window;
    return MajorityFilter(image, params);
}

RasterStack MajorityFilter(const RasterStack& bands, const MajorityFilterParams& params) {
    RasterStack output;
    for (size_t b = 0; b < bands.BandCount(); ++b) {
        output.AddBand(MajorityFilter(bands.Band(b), params));
    }
    return output;
}

} // namespace Geo::Raster::Filter
