#pragma once

/**
 * @file GeoRaster.h
 * @brief Main header file for GeoRaster library
 *
 * GeoRaster provides tiled texture analysis and categorical filtering
 * for georeferenced single-band rasters.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <GeoRaster/GeoRasterConfig.h>
#include <GeoRaster/Core/Export.h>

// Core types and utilities
#include <GeoRaster/Core/Types.h>
#include <GeoRaster/Core/Constants.h>
#include <GeoRaster/Core/Exception.h>

// Core data structures
#include <GeoRaster/Core/GeoTransform.h>
#include <GeoRaster/Core/RasterGrid.h>
#include <GeoRaster/Core/RasterStack.h>

// Platform abstraction
#include <GeoRaster/Platform/Config.h>
#include <GeoRaster/Platform/Log.h>
#include <GeoRaster/Platform/Thread.h>

// Feature modules
#include <GeoRaster/Texture/Texture.h>
#include <GeoRaster/Filter/MajorityFilter.h>
#include <GeoRaster/Band/Band.h>
#include <GeoRaster/Transform/Resample.h>

namespace Geo::Raster {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return GEORASTER_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = GEORASTER_VERSION_MAJOR;
    minor = GEORASTER_VERSION_MINOR;
    patch = GEORASTER_VERSION_PATCH;
}

} // namespace Geo::Raster
