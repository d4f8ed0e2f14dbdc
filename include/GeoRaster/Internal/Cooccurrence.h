#pragma once

/**
 * @file Cooccurrence.h
 * @brief Gray level co-occurrence matrices (GLCM) and their reductions
 *
 * P(i,j) counts how often level i has a neighbor of level j at a fixed
 * offset. Four orientations at unit distance are supported:
 *
 *   135   90   45
 *      \  |  /
 *       \ | /
 *         o ---- 0
 *
 * Reductions always work on the probability mass (P divided by its sum),
 * so they give the same result for raw and normalized matrices.
 */

#include <GeoRaster/Internal/Quantize.h>

#include <array>
#include <cstdint>
#include <vector>

namespace Geo::Raster::Internal {

/**
 * @brief Co-occurrence orientation at unit distance
 */
enum class GlcmOrientation {
    Deg0,       ///< (0, +1) right
    Deg45,      ///< (-1, +1) up-right
    Deg90,      ///< (-1, 0) up
    Deg135      ///< (-1, -1) up-left
};

/// All four orientations, in angle order
constexpr std::array<GlcmOrientation, 4> GLCM_ORIENTATIONS = {
    GlcmOrientation::Deg0, GlcmOrientation::Deg45,
    GlcmOrientation::Deg90, GlcmOrientation::Deg135
};

/**
 * @brief Pixel offset (row, col) of an orientation at the given distance
 */
void GlcmOffset(GlcmOrientation orientation, int32_t distance,
                int32_t& dRow, int32_t& dCol);

/**
 * @brief Square co-occurrence matrix (numLevels x numLevels)
 */
class CooccurrenceMatrix {
public:
    CooccurrenceMatrix() = default;
    explicit CooccurrenceMatrix(int32_t numLevels);

    /// Reset to numLevels x numLevels zeros
    void Reset(int32_t numLevels);

    int32_t Levels() const { return numLevels_; }

    double At(int32_t i, int32_t j) const {
        return data_[static_cast<size_t>(i) * numLevels_ + j];
    }

    void Add(int32_t i, int32_t j, double weight = 1.0) {
        data_[static_cast<size_t>(i) * numLevels_ + j] += weight;
    }

    /// Sum of all entries
    double Sum() const;

    /// Divide by the sum so entries add up to 1 (no-op for an all-zero matrix)
    void Normalize();

    bool IsSymmetric() const;

    const std::vector<double>& Data() const { return data_; }

private:
    int32_t numLevels_ = 0;
    std::vector<double> data_;
};

/**
 * @brief Build the co-occurrence matrix of a quantized tile
 * @param tile Quantized tile; MISSING_LEVEL samples are skipped
 * @param orientation Neighbor direction
 * @param distance Neighbor distance in pixels (>= 1)
 * @param symmetric Count both (i,j) and (j,i) for every pair
 * @param normed Normalize so the matrix sums to 1
 * @param glcm Output matrix (tile.numLevels x tile.numLevels)
 */
void ComputeCooccurrence(const QuantizedTile& tile, GlcmOrientation orientation,
                         int32_t distance, bool symmetric, bool normed,
                         CooccurrenceMatrix& glcm);

// =============================================================================
// Reductions
// =============================================================================

/// sum P(i,j) * |i - j|
double GlcmDissimilarity(const CooccurrenceMatrix& glcm);

/// sum P(i,j) / (1 + (i - j)^2)
double GlcmHomogeneity(const CooccurrenceMatrix& glcm);

/// -sum P(i,j) * ln P(i,j), zero entries contribute 0
double GlcmEntropy(const CooccurrenceMatrix& glcm);

} // namespace Geo::Raster::Internal
