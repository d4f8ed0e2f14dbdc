#include <GeoRaster/Core/RasterGrid.h>
#include <GeoRaster/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace Geo::Raster {

// =============================================================================
// Implementation class
// =============================================================================

class RasterGrid::Impl {
public:
    int32_t rows_ = 0;
    int32_t cols_ = 0;
    std::vector<double> data_;

    // Georeferencing
    bool hasTransform_ = false;
    GeoTransform transform_;
    std::string crs_;

    void Allocate(int32_t rows, int32_t cols, double fill) {
        rows_ = rows;
        cols_ = cols;
        data_.assign(static_cast<size_t>(rows) * static_cast<size_t>(cols), fill);
    }

    void CheckIndex(int32_t row, int32_t col) const {
        if (row < 0 || row >= rows_ || col < 0 || col >= cols_) {
            throw OutOfRangeException(
                "RasterGrid: index (" + std::to_string(row) + ", " +
                std::to_string(col) + ") outside " + std::to_string(rows_) +
                "x" + std::to_string(cols_));
        }
    }
};

// =============================================================================
// Constructors
// =============================================================================

RasterGrid::RasterGrid() : impl_(std::make_shared<Impl>()) {}

RasterGrid::RasterGrid(int32_t rows, int32_t cols, double fill)
    : impl_(std::make_shared<Impl>())
{
    if (rows <= 0 || cols <= 0) {
        throw InvalidArgumentException("RasterGrid dimensions must be positive");
    }
    impl_->Allocate(rows, cols, fill);
}

RasterGrid::RasterGrid(const RasterGrid& other) = default;
RasterGrid::RasterGrid(RasterGrid&& other) noexcept = default;
RasterGrid::~RasterGrid() = default;
RasterGrid& RasterGrid::operator=(const RasterGrid& other) = default;
RasterGrid& RasterGrid::operator=(RasterGrid&& other) noexcept = default;

// =============================================================================
// Factory Methods
// =============================================================================

RasterGrid RasterGrid::FromData(const double* data, int32_t rows, int32_t cols) {
    if (data == nullptr) {
        throw InvalidArgumentException("RasterGrid::FromData: data is null");
    }
    RasterGrid grid(rows, cols);
    std::memcpy(grid.Data(), data,
                static_cast<size_t>(rows) * static_cast<size_t>(cols) * sizeof(double));
    return grid;
}

RasterGrid RasterGrid::FromVector(const std::vector<double>& values,
                                  int32_t rows, int32_t cols) {
    if (rows <= 0 || cols <= 0) {
        throw InvalidArgumentException("RasterGrid::FromVector: dimensions must be positive");
    }
    size_t expected = static_cast<size_t>(rows) * static_cast<size_t>(cols);
    if (values.size() != expected) {
        throw ShapeMismatchException(
            "RasterGrid::FromVector: " + std::to_string(values.size()) +
            " values for " + std::to_string(rows) + "x" + std::to_string(cols));
    }
    return FromData(values.data(), rows, cols);
}

RasterGrid RasterGrid::FromRows(const std::vector<std::vector<double>>& rows) {
    if (rows.empty() || rows.front().empty()) {
        return RasterGrid();
    }
    int32_t numRows = static_cast<int32_t>(rows.size());
    int32_t numCols = static_cast<int32_t>(rows.front().size());

    RasterGrid grid(numRows, numCols);
    for (int32_t r = 0; r < numRows; ++r) {
        if (static_cast<int32_t>(rows[r].size()) != numCols) {
            throw ShapeMismatchException(
                "RasterGrid::FromRows: row " + std::to_string(r) + " has " +
                std::to_string(rows[r].size()) + " values, expected " +
                std::to_string(numCols));
        }
        std::copy(rows[r].begin(), rows[r].end(), grid.RowPtr(r));
    }
    return grid;
}

// =============================================================================
// Basic Properties
// =============================================================================

int32_t RasterGrid::Rows() const { return impl_->rows_; }
int32_t RasterGrid::Cols() const { return impl_->cols_; }
Shape2i RasterGrid::Shape() const { return {impl_->rows_, impl_->cols_}; }
int64_t RasterGrid::Count() const { return Shape().Count(); }
bool RasterGrid::Empty() const { return impl_->rows_ == 0 || impl_->cols_ == 0; }
bool RasterGrid::IsValid() const { return !Empty() && !impl_->data_.empty(); }

bool RasterGrid::SameShape(const RasterGrid& other) const {
    return Shape() == other.Shape();
}

// =============================================================================
// Data Access
// =============================================================================

double* RasterGrid::Data() { return impl_->data_.data(); }
const double* RasterGrid::Data() const { return impl_->data_.data(); }

double* RasterGrid::RowPtr(int32_t row) {
    return impl_->data_.data() + static_cast<size_t>(row) * impl_->cols_;
}

const double* RasterGrid::RowPtr(int32_t row) const {
    return impl_->data_.data() + static_cast<size_t>(row) * impl_->cols_;
}

double RasterGrid::At(int32_t row, int32_t col) const {
    impl_->CheckIndex(row, col);
    return RowPtr(row)[col];
}

void RasterGrid::SetAt(int32_t row, int32_t col, double value) {
    impl_->CheckIndex(row, col);
    RowPtr(row)[col] = value;
}

void RasterGrid::Fill(double value) {
    std::fill(impl_->data_.begin(), impl_->data_.end(), value);
}

bool RasterGrid::HasNaN() const {
    return std::any_of(impl_->data_.begin(), impl_->data_.end(),
                       [](double v) { return std::isnan(v); });
}

std::vector<double> RasterGrid::ToVector() const {
    return impl_->data_;
}

// =============================================================================
// Raster Operations
// =============================================================================

RasterGrid RasterGrid::Clone() const {
    RasterGrid copy;
    *copy.impl_ = *impl_;
    return copy;
}

RasterGrid RasterGrid::Crop(const Rect2i& rect) const {
    int32_t r0 = std::max(0, rect.row);
    int32_t c0 = std::max(0, rect.col);
    int32_t r1 = std::min(impl_->rows_, rect.Bottom());
    int32_t c1 = std::min(impl_->cols_, rect.Right());
    if (r1 <= r0 || c1 <= c0) {
        return RasterGrid();
    }

    RasterGrid out(r1 - r0, c1 - c0);
    for (int32_t r = r0; r < r1; ++r) {
        const double* src = RowPtr(r) + c0;
        std::copy(src, src + (c1 - c0), out.RowPtr(r - r0));
    }

    out.impl_->crs_ = impl_->crs_;
    if (impl_->hasTransform_) {
        const GeoTransform& t = impl_->transform_;
        Point2d origin = t.PixelToWorld(c0, r0);
        out.SetGeoTransform(GeoTransform(t.A(), t.B(), origin.x,
                                         t.D(), t.E(), origin.y));
    }
    return out;
}

// =============================================================================
// Georeferencing
// =============================================================================

bool RasterGrid::HasGeoTransform() const { return impl_->hasTransform_; }
const GeoTransform& RasterGrid::GetGeoTransform() const { return impl_->transform_; }

void RasterGrid::SetGeoTransform(const GeoTransform& transform) {
    impl_->transform_ = transform;
    impl_->hasTransform_ = true;
}

void RasterGrid::ClearGeoTransform() {
    impl_->transform_ = GeoTransform();
    impl_->hasTransform_ = false;
}

const std::string& RasterGrid::Crs() const { return impl_->crs_; }
void RasterGrid::SetCrs(const std::string& crs) { impl_->crs_ = crs; }

void RasterGrid::CopyGeoreference(const RasterGrid& other) {
    impl_->transform_ = other.impl_->transform_;
    impl_->hasTransform_ = other.impl_->hasTransform_;
    impl_->crs_ = other.impl_->crs_;
}

Extent2d RasterGrid::Extent() const {
    return impl_->transform_.ExtentOf(impl_->rows_, impl_->cols_);
}

} // namespace Geo::Raster
