#pragma once

/**
 * @file Log.h
 * @brief Library logger
 *
 * All library diagnostics go through one spdlog logger named "georaster"
 * writing to stderr. The initial level comes from GEORASTER_LOG_LEVEL.
 *
 * @code
 * Platform::Logger()->debug("GlcmTexture: {}x{} tiles", rows, cols);
 * Platform::SetLogLevel(spdlog::level::debug);
 * @endcode
 */

#include <spdlog/spdlog.h>

#include <memory>

namespace Geo::Raster::Platform {

/// Name the library logger is registered under
constexpr const char* LOGGER_NAME = "georaster";

/**
 * @brief Get the library logger (created on first use)
 */
std::shared_ptr<spdlog::logger> Logger();

/**
 * @brief Change the library log level
 */
void SetLogLevel(spdlog::level::level_enum level);

/**
 * @brief Current library log level
 */
spdlog::level::level_enum GetLogLevel();

} // namespace Geo::Raster::Platform
