#pragma once

/**
 * @file Config.h
 * @brief Process-wide runtime configuration
 *
 * Settings are read once from the environment on first use:
 * - GEORASTER_NUM_THREADS: worker pool size (positive integer, default auto)
 * - GEORASTER_LOG_LEVEL: trace, debug, info, warn, error, critical, off (default warn)
 *
 * Invalid values fall back to the default and are reported as warnings
 * through the library logger.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace Geo::Raster::Platform {

/// Environment variable names
constexpr const char* ENV_NUM_THREADS = "GEORASTER_NUM_THREADS";
constexpr const char* ENV_LOG_LEVEL = "GEORASTER_LOG_LEVEL";

/**
 * @brief Runtime settings
 */
struct RuntimeConfig {
    size_t numThreads = 0;              ///< Worker threads, 0 = from hardware
    std::string logLevel = "warn";      ///< spdlog level name
    std::vector<std::string> warnings;  ///< Problems found while parsing
};

/**
 * @brief Build a configuration from raw setting values
 * @param numThreads Value of GEORASTER_NUM_THREADS (nullptr if unset)
 * @param logLevel Value of GEORASTER_LOG_LEVEL (nullptr if unset)
 */
RuntimeConfig ParseRuntimeConfig(const char* numThreads, const char* logLevel);

/**
 * @brief Configuration of this process, read from the environment once
 */
const RuntimeConfig& GetRuntimeConfig();

} // namespace Geo::Raster::Platform
