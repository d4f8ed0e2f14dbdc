/**
 * @file Resample.cpp
 * @brief Area-average resampling implementation
 */

#include <GeoRaster/Transform/Resample.h>
#include <GeoRaster/Core/Exception.h>
#include <GeoRaster/Core/Validate.h>
#include <GeoRaster/Platform/Log.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace Geo::Raster::Transform {

namespace {

// Contribution of one input cell to one output cell along an axis
struct AxisWeight {
    int32_t index;
    double weight;
};

// For every output cell, the input cells it overlaps and the overlap length
std::vector<std::vector<AxisWeight>> BuildAxisWeights(int32_t inSize, int32_t outSize) {
    const double step = static_cast<double>(inSize) / static_cast<double>(outSize);
    std::vector<std::vector<AxisWeight>> weights(static_cast<size_t>(outSize));

    for (int32_t o = 0; o < outSize; ++o) {
        const double lo = o * step;
        const double hi = (o + 1 == outSize) ? static_cast<double>(inSize) : (o + 1) * step;
        const int32_t first = static_cast<int32_t>(std::floor(lo));
        const int32_t last = std::min(inSize - 1, static_cast<int32_t>(std::ceil(hi)) - 1);
        for (int32_t i = first; i <= last; ++i) {
            const double overlap = std::min(hi, i + 1.0) - std::max(lo, static_cast<double>(i));
            if (overlap > 0.0) {
                weights[static_cast<size_t>(o)].push_back({i, overlap});
            }
        }
    }
    return weights;
}

} // anonymous namespace

Shape2i ResampleShape(int32_t rows, int32_t cols, double factor) {
    Validate::RequireFinite(factor, "factor", "ResampleShape");
    Validate::RequirePositive(factor, "factor", "ResampleShape");
    const auto scaled = [factor](int32_t n) {
        const double size = std::floor(static_cast<double>(n) * factor);
        if (size > static_cast<double>(std::numeric_limits<int32_t>::max())) {
            throw InvalidArgumentException(
                "ResampleShape: factor " + std::to_string(factor) + " gives " +
                std::to_string(size) + " samples along an axis of " + std::to_string(n) +
                ", exceeds int32 range");
        }
        return std::max<int32_t>(1, static_cast<int32_t>(size));
    };
    return {scaled(rows), scaled(cols)};
}

RasterGrid ResampleAverageSize(const RasterGrid& image, int32_t outRows, int32_t outCols,
                               const Platform::CancelToken* cancel) {
    Validate::RequirePositive(outRows, "outRows", "ResampleAverageSize");
    Validate::RequirePositive(outCols, "outCols", "ResampleAverageSize");
    GEORASTER_REQUIRE_RASTER(image);

    const int32_t rows = image.Rows();
    const int32_t cols = image.Cols();

    Platform::Logger()->debug("ResampleAverage: {}x{} -> {}x{}", rows, cols, outRows, outCols);

    const auto rowWeights = BuildAxisWeights(rows, outRows);
    const auto colWeights = BuildAxisWeights(cols, outCols);

    RasterGrid output(outRows, outCols);
    Platform::ParallelFor(0, static_cast<size_t>(outRows), [&](size_t r) {
        double* dst = output.RowPtr(static_cast<int32_t>(r));
        for (int32_t c = 0; c < outCols; ++c) {
            double sum = 0.0;
            double weight = 0.0;
            for (const auto& wy : rowWeights[r]) {
                const double* src = image.RowPtr(wy.index);
                for (const auto& wx : colWeights[static_cast<size_t>(c)]) {
                    const double v = src[wx.index];
                    if (std::isnan(v)) {
                        continue;
                    }
                    const double w = wy.weight * wx.weight;
                    sum += w * v;
                    weight += w;
                }
            }
            dst[c] = (weight > 0.0) ? sum / weight
                                    : std::numeric_limits<double>::quiet_NaN();
        }
    }, 0, cancel);

    output.SetCrs(image.Crs());
    if (image.HasGeoTransform()) {
        output.SetGeoTransform(image.GetGeoTransform().Scaled(
            static_cast<double>(cols) / outCols, static_cast<double>(rows) / outRows));
    }
    return output;
}

RasterGrid ResampleAverage(const RasterGrid& image, const ResampleParams& params) {
    const Shape2i shape = ResampleShape(image.Rows(), image.Cols(), params.factor);
    return ResampleAverageSize(image, shape.rows, shape.cols, params.cancel);
}

RasterGrid ResampleAverage(const RasterGrid& image, double factor) {
    ResampleParams params;
    params.factor = factor;
    return ResampleAverage(image, params);
}

RasterStack ResampleAverage(const RasterStack& bands, const ResampleParams& params) {
    RasterStack output;
    for (size_t b = 0; b < bands.BandCount(); ++b) {
        output.AddBand(ResampleAverage(bands.Band(b), params));
    }
    return output;
}

} // namespace Geo::Raster::Transform
