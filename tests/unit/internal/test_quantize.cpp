/**
 * @file test_quantize.cpp
 * @brief Unit tests for Internal/Quantize.h
 */

#include <gtest/gtest.h>
#include <GeoRaster/Internal/Quantize.h>
#include <GeoRaster/Core/Exception.h>

#include <cmath>
#include <limits>

using namespace Geo::Raster;
using namespace Geo::Raster::Internal;

namespace {
const double NaN = std::numeric_limits<double>::quiet_NaN();
}

// =============================================================================
// RoundHalfEven
// =============================================================================

TEST(QuantizeTest, RoundHalfEvenTies) {
    EXPECT_DOUBLE_EQ(RoundHalfEven(0.5), 0.0);
    EXPECT_DOUBLE_EQ(RoundHalfEven(1.5), 2.0);
    EXPECT_DOUBLE_EQ(RoundHalfEven(2.5), 2.0);
    EXPECT_DOUBLE_EQ(RoundHalfEven(3.5), 4.0);
    EXPECT_DOUBLE_EQ(RoundHalfEven(-1.5), -2.0);
    EXPECT_DOUBLE_EQ(RoundHalfEven(-2.5), -2.0);
}

TEST(QuantizeTest, RoundHalfEvenNonTies) {
    EXPECT_DOUBLE_EQ(RoundHalfEven(2.4), 2.0);
    EXPECT_DOUBLE_EQ(RoundHalfEven(2.6), 3.0);
    EXPECT_DOUBLE_EQ(RoundHalfEven(7.0), 7.0);
}

// =============================================================================
// Tile Quantization
// =============================================================================

TEST(QuantizeTest, ScalesByTileMaximum) {
    // L = 4, max = 6: v * 3 / 6 = 0.5, 1.5, 2.5, 3.0
    RasterGrid grid = RasterGrid::FromRows({{1, 3}, {5, 6}});
    std::vector<double> scratch;
    QuantizedTile tile;

    ASSERT_EQ(QuantizeTile(grid, Rect2i(0, 0, 2, 2), 4, scratch, tile), QuantizeStatus::Ok);
    EXPECT_EQ(tile.rows, 2);
    EXPECT_EQ(tile.cols, 2);
    EXPECT_EQ(tile.numLevels, 4);
    EXPECT_EQ(tile.At(0, 0), 0);
    EXPECT_EQ(tile.At(0, 1), 2);
    EXPECT_EQ(tile.At(1, 0), 2);
    EXPECT_EQ(tile.At(1, 1), 3);
}

TEST(QuantizeTest, MaximumMapsToTopLevel) {
    RasterGrid grid = RasterGrid::FromRows({{0.2, 0.4, 0.8}});
    std::vector<double> scratch;
    QuantizedTile tile;

    ASSERT_EQ(QuantizeTile(grid, Rect2i(0, 0, 1, 3), 32, scratch, tile), QuantizeStatus::Ok);
    EXPECT_EQ(tile.At(0, 2), 31);
    for (int32_t level : tile.levels) {
        EXPECT_GE(level, 0);
        EXPECT_LE(level, 31);
    }
}

TEST(QuantizeTest, NegativeValuesClampToZero) {
    RasterGrid grid = RasterGrid::FromRows({{-4, 2}});
    std::vector<double> scratch;
    QuantizedTile tile;

    ASSERT_EQ(QuantizeTile(grid, Rect2i(0, 0, 1, 2), 8, scratch, tile), QuantizeStatus::Ok);
    EXPECT_EQ(tile.At(0, 0), 0);
    EXPECT_EQ(tile.At(0, 1), 7);
}

TEST(QuantizeTest, SubWindowOnly) {
    RasterGrid grid = RasterGrid::FromRows({{100, 100, 100}, {100, 1, 2}});
    std::vector<double> scratch;
    QuantizedTile tile;

    ASSERT_EQ(QuantizeTile(grid, Rect2i(1, 1, 1, 2), 3, scratch, tile), QuantizeStatus::Ok);
    EXPECT_EQ(tile.At(0, 0), 1);    // 1 * 2 / 2
    EXPECT_EQ(tile.At(0, 1), 2);
}

TEST(QuantizeTest, ZeroMaximumIsDegenerate) {
    RasterGrid grid(3, 3, 0.0);
    std::vector<double> scratch;
    QuantizedTile tile;
    EXPECT_EQ(QuantizeTile(grid, Rect2i(0, 0, 3, 3), 8, scratch, tile),
              QuantizeStatus::Degenerate);
}

TEST(QuantizeTest, AllNaNIsDegenerate) {
    RasterGrid grid(2, 2, NaN);
    std::vector<double> scratch;
    QuantizedTile tile;
    EXPECT_EQ(QuantizeTile(grid, Rect2i(0, 0, 2, 2), 8, scratch, tile),
              QuantizeStatus::Degenerate);
}

TEST(QuantizeTest, NaNSamplesAreMissing) {
    RasterGrid grid = RasterGrid::FromRows({{NaN, 4}});
    std::vector<double> scratch;
    QuantizedTile tile;

    ASSERT_EQ(QuantizeTile(grid, Rect2i(0, 0, 1, 2), 5, scratch, tile), QuantizeStatus::Ok);
    EXPECT_EQ(tile.At(0, 0), MISSING_LEVEL);
    EXPECT_EQ(tile.At(0, 1), 4);
}

TEST(QuantizeTest, SourceRasterUnchanged) {
    RasterGrid grid = RasterGrid::FromRows({{1, 3}, {5, 6}});
    std::vector<double> scratch;
    QuantizedTile tile;
    QuantizeTile(grid, Rect2i(0, 0, 2, 2), 4, scratch, tile);
    EXPECT_DOUBLE_EQ(grid.At(0, 1), 3.0);
    EXPECT_DOUBLE_EQ(grid.At(1, 1), 6.0);
}

TEST(QuantizeTest, WindowOutsideRasterThrows) {
    RasterGrid grid(2, 2, 1.0);
    std::vector<double> scratch;
    EXPECT_THROW(CopyWindow(grid, Rect2i(1, 1, 2, 2), scratch), OutOfRangeException);
}
