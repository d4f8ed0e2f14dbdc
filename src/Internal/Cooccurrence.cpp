/**
 * @file Cooccurrence.cpp
 * @brief Gray level co-occurrence matrices and reductions
 */

#include <GeoRaster/Internal/Cooccurrence.h>
#include <GeoRaster/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>

namespace Geo::Raster::Internal {

void GlcmOffset(GlcmOrientation orientation, int32_t distance,
                int32_t& dRow, int32_t& dCol) {
    switch (orientation) {
        case GlcmOrientation::Deg0:   dRow = 0;         dCol = distance;  return;
        case GlcmOrientation::Deg45:  dRow = -distance; dCol = distance;  return;
        case GlcmOrientation::Deg90:  dRow = -distance; dCol = 0;         return;
        case GlcmOrientation::Deg135: dRow = -distance; dCol = -distance; return;
    }
    throw InvalidArgumentException("GlcmOffset: unknown orientation");
}

// =============================================================================
// CooccurrenceMatrix
// =============================================================================

CooccurrenceMatrix::CooccurrenceMatrix(int32_t numLevels) {
    Reset(numLevels);
}

void CooccurrenceMatrix::Reset(int32_t numLevels) {
    if (numLevels < 1) {
        throw InvalidArgumentException("CooccurrenceMatrix: numLevels must be > 0");
    }
    numLevels_ = numLevels;
    data_.assign(static_cast<size_t>(numLevels) * numLevels, 0.0);
}

double CooccurrenceMatrix::Sum() const {
    return std::accumulate(data_.begin(), data_.end(), 0.0);
}

void CooccurrenceMatrix::Normalize() {
    double sum = Sum();
    if (sum > 0) {
        for (auto& p : data_) {
            p /= sum;
        }
    }
}

bool CooccurrenceMatrix::IsSymmetric() const {
    for (int32_t i = 0; i < numLevels_; ++i) {
        for (int32_t j = i + 1; j < numLevels_; ++j) {
            if (At(i, j) != At(j, i)) return false;
        }
    }
    return true;
}

// =============================================================================
// Construction
// =============================================================================

void ComputeCooccurrence(const QuantizedTile& tile, GlcmOrientation orientation,
                         int32_t distance, bool symmetric, bool normed,
                         CooccurrenceMatrix& glcm) {
    if (distance < 1) {
        throw InvalidArgumentException("ComputeCooccurrence: distance must be > 0");
    }
    glcm.Reset(tile.numLevels);

    int32_t dRow = 0, dCol = 0;
    GlcmOffset(orientation, distance, dRow, dCol);

    const int32_t rows = tile.rows;
    const int32_t cols = tile.cols;
    for (int32_t r = std::max(0, -dRow); r < rows - std::max(0, dRow); ++r) {
        for (int32_t c = std::max(0, -dCol); c < cols - std::max(0, dCol); ++c) {
            int32_t i = tile.At(r, c);
            int32_t j = tile.At(r + dRow, c + dCol);
            if (i == MISSING_LEVEL || j == MISSING_LEVEL) {
                continue;
            }
            glcm.Add(i, j);
            if (symmetric) {
                glcm.Add(j, i);
            }
        }
    }

    if (normed) {
        glcm.Normalize();
    }
}

// =============================================================================
// Reductions
// =============================================================================

namespace {

// Sum of weight(|i-j|) * P(i,j) over the probability mass
template<typename Weight>
double WeightedMass(const CooccurrenceMatrix& glcm, Weight weight) {
    double sum = glcm.Sum();
    if (sum <= 0) {
        return 0.0;
    }
    const int32_t n = glcm.Levels();
    double acc = 0.0;
    for (int32_t i = 0; i < n; ++i) {
        for (int32_t j = 0; j < n; ++j) {
            double p = glcm.At(i, j);
            if (p > 0) {
                acc += weight(std::abs(i - j)) * p;
            }
        }
    }
    return acc / sum;
}

} // anonymous namespace

double GlcmDissimilarity(const CooccurrenceMatrix& glcm) {
    return WeightedMass(glcm, [](int32_t diff) { return static_cast<double>(diff); });
}

double GlcmHomogeneity(const CooccurrenceMatrix& glcm) {
    return WeightedMass(glcm, [](int32_t diff) {
        return 1.0 / (1.0 + static_cast<double>(diff) * diff);
    });
}

double GlcmEntropy(const CooccurrenceMatrix& glcm) {
    double sum = glcm.Sum();
    if (sum <= 0) {
        return 0.0;
    }
    double entropy = 0.0;
    for (double count : glcm.Data()) {
        if (count > 0) {
            double p = count / sum;
            entropy -= p * std::log(p);
        }
    }
    // A single occupied cell gives -1*ln(1) = -0
    return entropy > 0.0 ? entropy : 0.0;
}

} // namespace Geo::Raster::Internal
