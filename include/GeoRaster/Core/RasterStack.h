#pragma once

/**
 * @file RasterStack.h
 * @brief Band-stacked raster (bands x rows x cols)
 */

#include <GeoRaster/Core/RasterGrid.h>
#include <GeoRaster/Core/Export.h>

#include <string>
#include <vector>

namespace Geo::Raster {

/**
 * @brief Ordered set of equally shaped bands sharing one georeference
 *
 * The georeference of the stack is the one of its first band. Bands are
 * held as shallow handles; AddBand never modifies the band passed in.
 */
class GEORASTER_API RasterStack {
public:
    RasterStack() = default;

    /// Build from bands; all bands must share the same shape
    explicit RasterStack(std::vector<RasterGrid> bands);

    /**
     * @brief Append a band
     * @throws ShapeMismatchException if the band shape differs from the stack
     */
    void AddBand(const RasterGrid& band);

    size_t BandCount() const { return bands_.size(); }
    bool Empty() const { return bands_.empty(); }

    /// Shape shared by every band (0x0 if the stack is empty)
    Shape2i Shape() const;

    /// Band access, bounds checked
    const RasterGrid& Band(size_t index) const;
    RasterGrid& Band(size_t index);

    const std::vector<RasterGrid>& Bands() const { return bands_; }

    /// Deep copy of every band
    RasterStack Clone() const;

private:
    std::vector<RasterGrid> bands_;
};

} // namespace Geo::Raster
