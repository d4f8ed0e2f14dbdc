/**
 * @file test_cooccurrence.cpp
 * @brief Unit tests for Internal/Cooccurrence.h
 */

#include <gtest/gtest.h>
#include <GeoRaster/Internal/Cooccurrence.h>
#include <GeoRaster/Core/Exception.h>

#include <cmath>

using namespace Geo::Raster;
using namespace Geo::Raster::Internal;

namespace {

QuantizedTile MakeTile(int32_t rows, int32_t cols, int32_t numLevels,
                       std::vector<int32_t> levels) {
    QuantizedTile tile;
    tile.rows = rows;
    tile.cols = cols;
    tile.numLevels = numLevels;
    tile.levels = std::move(levels);
    return tile;
}

// 0 1
// 1 0
QuantizedTile Checkerboard() {
    return MakeTile(2, 2, 2, {0, 1, 1, 0});
}

} // anonymous namespace

// =============================================================================
// Offsets
// =============================================================================

TEST(CooccurrenceTest, Offsets) {
    int32_t dr = 0, dc = 0;
    GlcmOffset(GlcmOrientation::Deg0, 1, dr, dc);
    EXPECT_EQ(dr, 0);  EXPECT_EQ(dc, 1);
    GlcmOffset(GlcmOrientation::Deg45, 1, dr, dc);
    EXPECT_EQ(dr, -1); EXPECT_EQ(dc, 1);
    GlcmOffset(GlcmOrientation::Deg90, 2, dr, dc);
    EXPECT_EQ(dr, -2); EXPECT_EQ(dc, 0);
    GlcmOffset(GlcmOrientation::Deg135, 1, dr, dc);
    EXPECT_EQ(dr, -1); EXPECT_EQ(dc, -1);
}

// =============================================================================
// Matrix Construction
// =============================================================================

TEST(CooccurrenceTest, HorizontalSymmetricCounts) {
    CooccurrenceMatrix glcm;
    ComputeCooccurrence(Checkerboard(), GlcmOrientation::Deg0, 1, true, false, glcm);
    EXPECT_EQ(glcm.Levels(), 2);
    EXPECT_DOUBLE_EQ(glcm.At(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(glcm.At(0, 1), 2.0);
    EXPECT_DOUBLE_EQ(glcm.At(1, 0), 2.0);
    EXPECT_DOUBLE_EQ(glcm.At(1, 1), 0.0);
    EXPECT_TRUE(glcm.IsSymmetric());
}

TEST(CooccurrenceTest, DiagonalOrientations) {
    CooccurrenceMatrix glcm;
    ComputeCooccurrence(Checkerboard(), GlcmOrientation::Deg45, 1, true, false, glcm);
    EXPECT_DOUBLE_EQ(glcm.At(1, 1), 2.0);
    EXPECT_DOUBLE_EQ(glcm.Sum(), 2.0);

    ComputeCooccurrence(Checkerboard(), GlcmOrientation::Deg135, 1, true, false, glcm);
    EXPECT_DOUBLE_EQ(glcm.At(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(glcm.Sum(), 2.0);
}

TEST(CooccurrenceTest, NonSymmetricCountsOneDirection) {
    QuantizedTile tile = MakeTile(1, 2, 3, {0, 2});
    CooccurrenceMatrix glcm;
    ComputeCooccurrence(tile, GlcmOrientation::Deg0, 1, false, false, glcm);
    EXPECT_DOUBLE_EQ(glcm.At(0, 2), 1.0);
    EXPECT_DOUBLE_EQ(glcm.At(2, 0), 0.0);
    EXPECT_FALSE(glcm.IsSymmetric());
}

TEST(CooccurrenceTest, NormedSumsToOne) {
    CooccurrenceMatrix glcm;
    ComputeCooccurrence(Checkerboard(), GlcmOrientation::Deg0, 1, true, true, glcm);
    EXPECT_NEAR(glcm.Sum(), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(glcm.At(0, 1), 0.5);
}

TEST(CooccurrenceTest, MissingLevelsSkipped) {
    QuantizedTile tile = MakeTile(1, 3, 2, {0, MISSING_LEVEL, 1});
    CooccurrenceMatrix glcm;
    ComputeCooccurrence(tile, GlcmOrientation::Deg0, 1, true, false, glcm);
    EXPECT_DOUBLE_EQ(glcm.Sum(), 0.0);
}

TEST(CooccurrenceTest, SingleColumnHasNoHorizontalPairs) {
    QuantizedTile tile = MakeTile(3, 1, 2, {0, 1, 1});
    CooccurrenceMatrix glcm;
    ComputeCooccurrence(tile, GlcmOrientation::Deg0, 1, true, false, glcm);
    EXPECT_DOUBLE_EQ(glcm.Sum(), 0.0);
    ComputeCooccurrence(tile, GlcmOrientation::Deg90, 1, true, false, glcm);
    EXPECT_DOUBLE_EQ(glcm.Sum(), 4.0);
}

TEST(CooccurrenceTest, InvalidDistanceThrows) {
    CooccurrenceMatrix glcm;
    EXPECT_THROW(ComputeCooccurrence(Checkerboard(), GlcmOrientation::Deg0, 0, true, true, glcm),
                 InvalidArgumentException);
}

// =============================================================================
// Reductions
// =============================================================================

TEST(CooccurrenceTest, ReductionsOfAlternatingPairs) {
    CooccurrenceMatrix glcm;
    ComputeCooccurrence(Checkerboard(), GlcmOrientation::Deg0, 1, true, true, glcm);
    EXPECT_DOUBLE_EQ(GlcmDissimilarity(glcm), 1.0);
    EXPECT_DOUBLE_EQ(GlcmHomogeneity(glcm), 0.5);
    EXPECT_NEAR(GlcmEntropy(glcm), std::log(2.0), 1e-12);
}

TEST(CooccurrenceTest, ReductionsOfSingleCell) {
    CooccurrenceMatrix glcm;
    ComputeCooccurrence(Checkerboard(), GlcmOrientation::Deg45, 1, true, true, glcm);
    EXPECT_DOUBLE_EQ(GlcmDissimilarity(glcm), 0.0);
    EXPECT_DOUBLE_EQ(GlcmHomogeneity(glcm), 1.0);
    EXPECT_DOUBLE_EQ(GlcmEntropy(glcm), 0.0);
}

TEST(CooccurrenceTest, ReductionsIgnoreNormalization) {
    CooccurrenceMatrix raw, normed;
    ComputeCooccurrence(Checkerboard(), GlcmOrientation::Deg0, 1, true, false, raw);
    ComputeCooccurrence(Checkerboard(), GlcmOrientation::Deg0, 1, true, true, normed);
    EXPECT_DOUBLE_EQ(GlcmDissimilarity(raw), GlcmDissimilarity(normed));
    EXPECT_DOUBLE_EQ(GlcmHomogeneity(raw), GlcmHomogeneity(normed));
    EXPECT_NEAR(GlcmEntropy(raw), GlcmEntropy(normed), 1e-12);
}

TEST(CooccurrenceTest, EmptyMatrixReducesToZero) {
    CooccurrenceMatrix glcm(4);
    EXPECT_DOUBLE_EQ(GlcmDissimilarity(glcm), 0.0);
    EXPECT_DOUBLE_EQ(GlcmHomogeneity(glcm), 0.0);
    EXPECT_DOUBLE_EQ(GlcmEntropy(glcm), 0.0);
}
