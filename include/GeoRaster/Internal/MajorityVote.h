#pragma once

/**
 * @file MajorityVote.h
 * @brief Most frequent value of a categorical neighborhood
 */

#include <cstdint>
#include <vector>

namespace Geo::Raster::Internal {

/**
 * @brief Most frequent value in a set of categorical samples
 * @param values Samples; reordered in place
 * @param count Optional output: occurrences of the winning value
 * @return Winning value, NaN for an empty set
 *
 * All NaN samples form one category that sorts after every number.
 * Ties go to the smallest value.
 */
double MajorityVote(std::vector<double>& values, int32_t* count = nullptr);

} // namespace Geo::Raster::Internal
