#pragma once

/**
 * @file Texture.h
 * @brief Tiled GLCM texture analysis
 *
 * The raster is cut into non-overlapping tiles (row-major from the top-left,
 * partial tiles at the bottom/right border are kept). Every tile is
 * quantized to a fixed number of gray levels, its co-occurrence matrices
 * are built for 0, 45, 90 and 135 degrees at unit distance, each matrix
 * is reduced to one texture value and the four values are averaged into
 * one output cell.
 *
 * Applications:
 * - Land cover classification from SAR or optical imagery
 * - Surface roughness maps
 *
 * @code
 * TextureParams params;
 * params.window = {5, 5};
 * params.property = TextureProperty::Homogeneity;
 * RasterGrid texture = GlcmTexture(backscatter, params);
 * @endcode
 */

#include <GeoRaster/Core/RasterGrid.h>
#include <GeoRaster/Core/RasterStack.h>
#include <GeoRaster/Core/Constants.h>
#include <GeoRaster/Core/Types.h>
#include <GeoRaster/Internal/Quantize.h>
#include <GeoRaster/Platform/Thread.h>

#include <string>

namespace Geo::Raster::Texture {

/**
 * @brief Scalar texture measure extracted from a co-occurrence matrix
 */
enum class TextureProperty {
    Dissimilarity,  ///< sum P(i,j) |i-j|, >= 0
    Homogeneity,    ///< sum P(i,j) / (1 + (i-j)^2), in [0, 1]
    Entropy         ///< -sum P(i,j) ln P(i,j), >= 0
};

/**
 * @brief What to do with a tile whose maximum is zero
 */
enum class DegeneratePolicy {
    Fail,   ///< Throw DegenerateWindowException, no output is returned
    NaN     ///< Write NaN into that tile's cell and continue
};

/**
 * @brief GLCM texture parameters
 */
struct TextureParams {
    WindowSize window{5, 5};                                ///< Tile height x width
    TextureProperty property = TextureProperty::Dissimilarity;
    int32_t grayLevels = DEFAULT_GRAY_LEVELS;               ///< Quantization levels [2, 256]
    bool normed = true;                                     ///< Normalize each matrix to sum 1
    DegeneratePolicy degeneratePolicy = DegeneratePolicy::Fail;
    const Platform::CancelToken* cancel = nullptr;          ///< Checked between tiles
};

/**
 * @brief Parse a property name ("dissimilarity", "homogeneity", "entropy")
 * @throws UnsupportedPropertyException for any other name
 */
TextureProperty ParseTextureProperty(const std::string& name);

/**
 * @brief Lower-case name of a property
 */
const char* TexturePropertyName(TextureProperty property);

/**
 * @brief Output shape for a raster of rows x cols cut into window tiles
 * @return (ceil(rows / window.height), ceil(cols / window.width))
 * @throws InvalidWindowException if the window is not positive
 */
Shape2i TextureOutputShape(int32_t rows, int32_t cols, const WindowSize& window);

/**
 * @brief Texture value of one quantized tile
 * @param tile Quantized tile
 * @param property Measure to extract
 * @param normed Normalize the matrices before reduction
 * @return Mean of the measure over the four orientations
 */
double TileTexture(const Internal::QuantizedTile& tile, TextureProperty property,
                   bool normed = true);

/**
 * @brief Compute the tiled GLCM texture of a raster
 * @param image Input raster (continuous intensities)
 * @param params Texture parameters
 * @return Texture grid of TextureOutputShape(); empty for an empty input
 *
 * The input is never modified. With a geotransform on the input, the
 * output transform spans one tile per pixel.
 *
 * @throws InvalidWindowException for a non-positive window
 * @throws InvalidArgumentException for grayLevels outside [2, 256]
 * @throws DegenerateWindowException under DegeneratePolicy::Fail
 * @throws CancelledException if params.cancel is set during the run
 */
RasterGrid GlcmTexture(const RasterGrid& image, const TextureParams& params);

/**
 * @brief String-keyed convenience overload
 * @throws UnsupportedPropertyException if property is not a known name
 */
RasterGrid GlcmTexture(const RasterGrid& image, const WindowSize& window,
                       const std::string& property,
                       int32_t grayLevels = DEFAULT_GRAY_LEVELS, bool normed = true);

/**
 * @brief Apply GlcmTexture to every band of a stack
 */
RasterStack GlcmTexture(const RasterStack& bands, const TextureParams& params);

} // namespace Geo::Raster::Texture
