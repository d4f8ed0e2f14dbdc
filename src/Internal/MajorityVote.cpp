/**
 * @file MajorityVote.cpp
 * @brief Most frequent value of a categorical neighborhood
 */

#include <GeoRaster/Internal/MajorityVote.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Geo::Raster::Internal {

double MajorityVote(std::vector<double>& values, int32_t* count) {
    // Numbers first, NaN block last
    auto nanBegin = std::partition(values.begin(), values.end(),
                                   [](double v) { return !std::isnan(v); });
    std::sort(values.begin(), nanBegin);

    double best = std::numeric_limits<double>::quiet_NaN();
    int32_t bestCount = 0;

    // Ascending scan with strict '>' keeps the smallest value on ties
    auto it = values.begin();
    while (it != nanBegin) {
        auto runEnd = std::upper_bound(it, nanBegin, *it);
        int32_t run = static_cast<int32_t>(runEnd - it);
        if (run > bestCount) {
            bestCount = run;
            best = *it;
        }
        it = runEnd;
    }

    int32_t nanCount = static_cast<int32_t>(values.end() - nanBegin);
    if (nanCount > bestCount) {
        bestCount = nanCount;
        best = std::numeric_limits<double>::quiet_NaN();
    }

    if (count != nullptr) {
        *count = bestCount;
    }
    return best;
}

} // namespace Geo::Raster::Internal
