#include <GeoRaster/Core/RasterStack.h>
#include <GeoRaster/Core/Exception.h>

#include <utility>

namespace Geo::Raster {

RasterStack::RasterStack(std::vector<RasterGrid> bands) {
    bands_.reserve(bands.size());
    for (const auto& band : bands) {
        AddBand(band);
    }
}

void RasterStack::AddBand(const RasterGrid& band) {
    if (!bands_.empty() && !bands_.front().SameShape(band)) {
        Shape2i s = Shape();
        throw ShapeMismatchException(
            "RasterStack::AddBand: band is " + std::to_string(band.Rows()) + "x" +
            std::to_string(band.Cols()) + ", stack is " + std::to_string(s.rows) +
            "x" + std::to_string(s.cols));
    }
    bands_.push_back(band);
}

Shape2i RasterStack::Shape() const {
    return bands_.empty() ? Shape2i() : bands_.front().Shape();
}

const RasterGrid& RasterStack::Band(size_t index) const {
    if (index >= bands_.size()) {
        throw OutOfRangeException("RasterStack::Band: index " + std::to_string(index) +
                                  " >= " + std::to_string(bands_.size()));
    }
    return bands_[index];
}

RasterGrid& RasterStack::Band(size_t index) {
    if (index >= bands_.size()) {
        throw OutOfRangeException("RasterStack::Band: index " + std::to_string(index) +
                                  " >= " + std::to_string(bands_.size()));
    }
    return bands_[index];
}

RasterStack RasterStack::Clone() const {
    RasterStack copy;
    copy.bands_.reserve(bands_.size());
    for (const auto& band : bands_) {
        copy.bands_.push_back(band.Clone());
    }
    return copy;
}

} // namespace Geo::Raster
