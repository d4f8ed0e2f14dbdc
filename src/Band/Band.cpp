/**
 * @file Band.cpp
 * @brief Band arithmetic implementation
 */

#include <GeoRaster/Band/Band.h>
#include <GeoRaster/Core/Exception.h>
#include <GeoRaster/Core/Validate.h>
#include <GeoRaster/Platform/Log.h>

#include <cmath>
#include <limits>

namespace Geo::Raster::Band {

namespace {

template<typename Op>
RasterGrid MapPixels(const RasterGrid& image, Op op) {
    RasterGrid output(image.Rows(), image.Cols());
    output.CopyGeoreference(image);

    const double* src = image.Data();
    double* dst = output.Data();
    const int64_t n = image.Count();
    for (int64_t i = 0; i < n; ++i) {
        dst[i] = op(src[i]);
    }
    return output;
}

} // anonymous namespace

// =============================================================================
// Unit Conversion
// =============================================================================

RasterGrid NaturalToDb(const RasterGrid& image) {
    GEORASTER_REQUIRE_RASTER(image);
    return MapPixels(image, [](double v) { return 10.0 * std::log10(v); });
}

RasterGrid DbToNatural(const RasterGrid& image) {
    GEORASTER_REQUIRE_RASTER(image);
    return MapPixels(image, [](double v) { return std::pow(10.0, v / 10.0); });
}

// =============================================================================
// Indices
// =============================================================================

RasterGrid NormalizedDifference(const RasterGrid& a, const RasterGrid& b, double scale) {
    Validate::RequireFinite(scale, "scale", "NormalizedDifference");
    Validate::RequireSameShape(a, b, "NormalizedDifference");
    GEORASTER_REQUIRE_RASTER(a);

    RasterGrid output(a.Rows(), a.Cols());
    output.CopyGeoreference(a);

    const double* pa = a.Data();
    const double* pb = b.Data();
    double* dst = output.Data();
    const int64_t n = a.Count();
    for (int64_t i = 0; i < n; ++i) {
        const double sum = pa[i] + pb[i];
        dst[i] = (sum == 0.0) ? std::numeric_limits<double>::quiet_NaN()
                              : (pa[i] - pb[i]) / sum * scale;
    }
    return output;
}

RasterStack AddIndices(const RasterStack& bands, double scale) {
    Validate::RequireBandCount(bands, 3, "AddIndices");

    const RasterGrid& b0 = bands.Band(0);
    const RasterGrid& b1 = bands.Band(1);
    const RasterGrid& b2 = bands.Band(2);

    RasterStack output = bands.Clone();
    output.AddBand(NormalizedDifference(b0, b1, scale));   // ndvi
    output.AddBand(NormalizedDifference(b2, b0, scale));   // ndwi
    output.AddBand(NormalizedDifference(b0, b2, scale));   // gvi

    Platform::Logger()->debug("AddIndices: {} bands -> {} bands",
                              bands.BandCount(), output.BandCount());
    return output;
}

// =============================================================================
// Gap Filling
// =============================================================================

RasterGrid FillNaNs(const RasterGrid& image) {
    GEORASTER_REQUIRE_RASTER(image);

    RasterGrid output = image.Clone();
    if (!image.HasNaN()) {
        return output;
    }

    double* data = output.Data();
    const int64_t n = output.Count();

    int64_t prev = -1;      // last finite index seen
    int64_t filled = 0;
    for (int64_t i = 0; i <= n; ++i) {
        if (i < n && std::isnan(data[i])) {
            continue;
        }
        // [prev + 1, i) is a NaN run
        const int64_t gapBegin = prev + 1;
        if (gapBegin < i) {
            if (prev < 0 && i == n) {
                throw InsufficientDataException("FillNaNs: raster has no finite sample");
            }
            for (int64_t k = gapBegin; k < i; ++k) {
                if (prev < 0) {
                    data[k] = data[i];
                } else if (i == n) {
                    data[k] = data[prev];
                } else {
                    const double t = static_cast<double>(k - prev) /
                                     static_cast<double>(i - prev);
                    data[k] = data[prev] + t * (data[i] - data[prev]);
                }
            }
            filled += i - gapBegin;
        }
        prev = i;
    }

    Platform::Logger()->info("FillNaNs: filled {} of {} samples", filled, n);
    return output;
}

} // namespace Geo::Raster::Band
