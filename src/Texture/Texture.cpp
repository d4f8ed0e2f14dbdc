/**
 * @file Texture.cpp
 * @brief Implementation of tiled GLCM texture analysis
 */

#include <GeoRaster/Texture/Texture.h>
#include <GeoRaster/Core/Exception.h>
#include <GeoRaster/Core/Validate.h>
#include <GeoRaster/Internal/Cooccurrence.h>
#include <GeoRaster/Platform/Log.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <vector>

namespace Geo::Raster::Texture {

namespace {

using Reduction = double (*)(const Internal::CooccurrenceMatrix&);

Reduction ReductionFor(TextureProperty property) {
    switch (property) {
        case TextureProperty::Dissimilarity: return &Internal::GlcmDissimilarity;
        case TextureProperty::Homogeneity:   return &Internal::GlcmHomogeneity;
        case TextureProperty::Entropy:       return &Internal::GlcmEntropy;
    }
    throw UnsupportedPropertyException(
        "texture property #" + std::to_string(static_cast<int>(property)));
}

} // anonymous namespace

// =============================================================================
// Property Names
// =============================================================================

TextureProperty ParseTextureProperty(const std::string& name) {
    if (name == "dissimilarity") return TextureProperty::Dissimilarity;
    if (name == "homogeneity") return TextureProperty::Homogeneity;
    if (name == "entropy") return TextureProperty::Entropy;
    throw UnsupportedPropertyException(
        "'" + name + "', expected one of 'entropy', 'dissimilarity', 'homogeneity'");
}

const char* TexturePropertyName(TextureProperty property) {
    switch (property) {
        case TextureProperty::Dissimilarity: return "dissimilarity";
        case TextureProperty::Homogeneity:   return "homogeneity";
        case TextureProperty::Entropy:       return "entropy";
    }
    return "unknown";
}

// =============================================================================
// Tiles
// =============================================================================

Shape2i TextureOutputShape(int32_t rows, int32_t cols, const WindowSize& window) {
    Validate::RequireWindow(window, "TextureOutputShape");
    if (rows < 0 || cols < 0) {
        throw InvalidArgumentException("TextureOutputShape: rows/cols must be >= 0");
    }
    return {rows / window.height + (rows % window.height != 0 ? 1 : 0),
            cols / window.width + (cols % window.width != 0 ? 1 : 0)};
}

double TileTexture(const Internal::QuantizedTile& tile, TextureProperty property,
                   bool normed) {
    Reduction reduce = ReductionFor(property);

    Internal::CooccurrenceMatrix glcm;
    double sum = 0.0;
    for (auto orientation : Internal::GLCM_ORIENTATIONS) {
        Internal::ComputeCooccurrence(tile, orientation, 1, true, normed, glcm);
        sum += reduce(glcm);
    }
    return sum / static_cast<double>(Internal::GLCM_ORIENTATIONS.size());
}

// =============================================================================
// Raster Texture
// =============================================================================

RasterGrid GlcmTexture(const RasterGrid& image, const TextureParams& params) {
    Validate::RequireWindow(params.window, "GlcmTexture");
    Validate::RequireRange(params.grayLevels, MIN_GRAY_LEVELS, MAX_GRAY_LEVELS,
                           "grayLevels", "GlcmTexture");
    ReductionFor(params.property);

    if (!Validate::RequireRasterValid(image, "GlcmTexture")) {
        return RasterGrid();
    }

    const int32_t rows = image.Rows();
    const int32_t cols = image.Cols();
    const int32_t wy = params.window.height;
    const int32_t wx = params.window.width;
    const Shape2i outShape = TextureOutputShape(rows, cols, params.window);
    const size_t numTiles = static_cast<size_t>(outShape.Count());

    Platform::Logger()->debug(
        "GlcmTexture: {}x{} raster, {}x{} window, {}x{} tiles, property={}, levels={}",
        rows, cols, wy, wx, outShape.rows, outShape.cols,
        TexturePropertyName(params.property), params.grayLevels);

    RasterGrid output(outShape.rows, outShape.cols,
                      std::numeric_limits<double>::quiet_NaN());
    std::vector<uint8_t> degenerate(numTiles, 0);
    // Lowest degenerate tile index seen so far; under Fail only tiles after it are skipped
    std::atomic<size_t> firstFailed{numTiles};
    const bool failFast = params.degeneratePolicy == DegeneratePolicy::Fail;

    Platform::ParallelFor(0, numTiles, [&](size_t t) {
        if (failFast && t > firstFailed.load(std::memory_order_relaxed)) {
            return;
        }
        const int32_t ty = static_cast<int32_t>(t / outShape.cols);
        const int32_t tx = static_cast<int32_t>(t % outShape.cols);
        const Rect2i rect(ty * wy, tx * wx,
                          std::min(wy, rows - ty * wy),
                          std::min(wx, cols - tx * wx));

        std::vector<double> scratch;
        Internal::QuantizedTile tile;
        if (Internal::QuantizeTile(image, rect, params.grayLevels, scratch, tile) ==
            Internal::QuantizeStatus::Degenerate) {
            degenerate[t] = 1;
            size_t seen = firstFailed.load(std::memory_order_relaxed);
            while (t < seen &&
                   !firstFailed.compare_exchange_weak(seen, t, std::memory_order_relaxed)) {
            }
            return;
        }
        output.RowPtr(ty)[tx] = TileTexture(tile, params.property, params.normed);
    }, 0, params.cancel);

    auto firstBad = std::find(degenerate.begin(), degenerate.end(), uint8_t{1});
    if (firstBad != degenerate.end()) {
        const size_t t = static_cast<size_t>(firstBad - degenerate.begin());
        const int32_t ty = static_cast<int32_t>(t / outShape.cols);
        const int32_t tx = static_cast<int32_t>(t % outShape.cols);
        if (failFast) {
            throw DegenerateWindowException(
                "GlcmTexture: tile (" + std::to_string(ty) + ", " + std::to_string(tx) +
                ") has maximum 0, quantization undefined", ty, tx);
        }
        Platform::Logger()->warn(
            "GlcmTexture: {} degenerate tile(s) set to NaN, first at ({}, {})",
            std::count(degenerate.begin(), degenerate.end(), uint8_t{1}), ty, tx);
    }

    // Internal consistency
    Validate::RequireShape(output.Shape(), outShape, "GlcmTexture");

    output.SetCrs(image.Crs());
    if (image.HasGeoTransform()) {
        output.SetGeoTransform(image.GetGeoTransform().Scaled(wx, wy));
    }
    return output;
}

RasterGrid GlcmTexture(const RasterGrid& image, const WindowSize& window,
                       const std::string& property, int32_t grayLevels, bool normed) {
    TextureParams params;
    params.window = window;
    params.property = ParseTextureProperty(property);
    params.grayLevels = grayLevels;
    params.normed = normed;
    return GlcmTexture(image, params);
}

RasterStack GlcmTexture(const RasterStack& bands, const TextureParams& params) {
    RasterStack output;
    for (size_t b = 0; b < bands.BandCount(); ++b) {
        output.AddBand(GlcmTexture(bands.Band(b), params));
    }
    return output;
}

} // namespace Geo::Raster::Texture
