/**
 * @file test_raster_grid.cpp
 * @brief Unit tests for Core/RasterGrid.h
 */

#include <gtest/gtest.h>
#include <GeoRaster/Core/RasterGrid.h>
#include <GeoRaster/Core/Exception.h>

#include <cmath>
#include <limits>

using namespace Geo::Raster;

// =============================================================================
// Construction
// =============================================================================

TEST(RasterGridTest, DefaultIsEmpty) {
    RasterGrid grid;
    EXPECT_TRUE(grid.Empty());
    EXPECT_FALSE(grid.IsValid());
    EXPECT_EQ(grid.Rows(), 0);
    EXPECT_EQ(grid.Cols(), 0);
    EXPECT_EQ(grid.Count(), 0);
}

TEST(RasterGridTest, SizedConstructorFills) {
    RasterGrid grid(3, 4, 2.5);
    EXPECT_EQ(grid.Rows(), 3);
    EXPECT_EQ(grid.Cols(), 4);
    EXPECT_EQ(grid.Shape(), Shape2i(3, 4));
    EXPECT_EQ(grid.Count(), 12);
    for (double v : grid.ToVector()) {
        EXPECT_DOUBLE_EQ(v, 2.5);
    }
}

TEST(RasterGridTest, NonPositiveDimensionsThrow) {
    EXPECT_THROW(RasterGrid(0, 3), InvalidArgumentException);
    EXPECT_THROW(RasterGrid(3, -1), InvalidArgumentException);
}

TEST(RasterGridTest, FromRows) {
    RasterGrid grid = RasterGrid::FromRows({{1, 2, 3}, {4, 5, 6}});
    EXPECT_EQ(grid.Shape(), Shape2i(2, 3));
    EXPECT_DOUBLE_EQ(grid.At(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(grid.At(1, 2), 6.0);
}

TEST(RasterGridTest, FromRowsRaggedThrows) {
    EXPECT_THROW(RasterGrid::FromRows({{1, 2, 3}, {4, 5}}), ShapeMismatchException);
}

TEST(RasterGridTest, FromRowsEmpty) {
    EXPECT_TRUE(RasterGrid::FromRows({}).Empty());
}

TEST(RasterGridTest, FromVectorSizeMismatchThrows) {
    EXPECT_THROW(RasterGrid::FromVector({1, 2, 3}, 2, 2), ShapeMismatchException);
    RasterGrid grid = RasterGrid::FromVector({1, 2, 3, 4}, 2, 2);
    EXPECT_DOUBLE_EQ(grid.At(1, 0), 3.0);
}

TEST(RasterGridTest, FromDataNullThrows) {
    EXPECT_THROW(RasterGrid::FromData(nullptr, 2, 2), InvalidArgumentException);
}

// =============================================================================
// Access
// =============================================================================

TEST(RasterGridTest, AtOutOfRangeThrows) {
    RasterGrid grid(2, 2);
    EXPECT_THROW(grid.At(2, 0), OutOfRangeException);
    EXPECT_THROW(grid.At(0, -1), OutOfRangeException);
    EXPECT_THROW(grid.SetAt(0, 2, 1.0), OutOfRangeException);
}

TEST(RasterGridTest, ErrorCodeOfOutOfRange) {
    RasterGrid grid(2, 2);
    try {
        grid.At(5, 5);
        FAIL() << "expected OutOfRangeException";
    } catch (const Exception& e) {
        EXPECT_EQ(e.Code(), ErrorCode::OutOfRange);
    }
}

TEST(RasterGridTest, HasNaN) {
    RasterGrid grid(2, 2, 1.0);
    EXPECT_FALSE(grid.HasNaN());
    grid.SetAt(1, 1, std::numeric_limits<double>::quiet_NaN());
    EXPECT_TRUE(grid.HasNaN());
}

// =============================================================================
// Copy Semantics
// =============================================================================

TEST(RasterGridTest, CopyIsShallow) {
    RasterGrid a(2, 2, 0.0);
    RasterGrid b = a;
    b.SetAt(0, 0, 9.0);
    EXPECT_DOUBLE_EQ(a.At(0, 0), 9.0);
    EXPECT_EQ(a.Data(), b.Data());
}

TEST(RasterGridTest, CloneIsDeep) {
    RasterGrid a(2, 2, 0.0);
    a.SetCrs("EPSG:4326");
    RasterGrid b = a.Clone();
    b.SetAt(0, 0, 9.0);
    EXPECT_DOUBLE_EQ(a.At(0, 0), 0.0);
    EXPECT_NE(a.Data(), b.Data());
    EXPECT_EQ(b.Crs(), "EPSG:4326");
}

// =============================================================================
// Crop
// =============================================================================

TEST(RasterGridTest, CropClipsAndShiftsOrigin) {
    RasterGrid grid = RasterGrid::FromRows({{1, 2, 3}, {4, 5, 6}, {7, 8, 9}});
    grid.SetGeoTransform(GeoTransform::FromOrigin(100.0, 200.0, 10.0, 10.0));

    RasterGrid crop = grid.Crop(Rect2i(1, 1, 5, 5));
    ASSERT_EQ(crop.Shape(), Shape2i(2, 2));
    EXPECT_DOUBLE_EQ(crop.At(0, 0), 5.0);
    EXPECT_DOUBLE_EQ(crop.At(1, 1), 9.0);
    EXPECT_DOUBLE_EQ(crop.GetGeoTransform().C(), 110.0);
    EXPECT_DOUBLE_EQ(crop.GetGeoTransform().F(), 190.0);
}

TEST(RasterGridTest, CropOutsideIsEmpty) {
    RasterGrid grid(3, 3);
    EXPECT_TRUE(grid.Crop(Rect2i(5, 5, 2, 2)).Empty());
}

// =============================================================================
// Georeferencing
// =============================================================================

TEST(RasterGridTest, GeoreferenceRoundTrip) {
    RasterGrid grid(4, 5);
    EXPECT_FALSE(grid.HasGeoTransform());

    grid.SetGeoTransform(GeoTransform::FromOrigin(0.0, 40.0, 10.0, 10.0));
    grid.SetCrs("EPSG:32633");
    EXPECT_TRUE(grid.HasGeoTransform());

    Extent2d extent = grid.Extent();
    EXPECT_DOUBLE_EQ(extent.left, 0.0);
    EXPECT_DOUBLE_EQ(extent.right, 50.0);
    EXPECT_DOUBLE_EQ(extent.bottom, 0.0);
    EXPECT_DOUBLE_EQ(extent.top, 40.0);

    RasterGrid other(4, 5);
    other.CopyGeoreference(grid);
    EXPECT_EQ(other.Crs(), "EPSG:32633");
    EXPECT_EQ(other.GetGeoTransform(), grid.GetGeoTransform());

    grid.ClearGeoTransform();
    EXPECT_FALSE(grid.HasGeoTransform());
    EXPECT_TRUE(other.HasGeoTransform());
}
