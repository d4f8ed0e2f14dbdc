#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - GEORASTER_BUILD_SHARED: when building GeoRaster as shared library
 *   - GEORASTER_USE_SHARED: when using GeoRaster as shared library
 *   - GEORASTER_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(GEORASTER_BUILD_SHARED)
        #define GEORASTER_API __declspec(dllexport)
    #elif defined(GEORASTER_USE_SHARED)
        #define GEORASTER_API __declspec(dllimport)
    #else
        #define GEORASTER_API
    #endif
#else
    #if defined(GEORASTER_BUILD_SHARED)
        #define GEORASTER_API __attribute__((visibility("default")))
    #else
        #define GEORASTER_API
    #endif
#endif
