/**
 * @file Log.cpp
 * @brief spdlog-backed library logger
 */

#include <GeoRaster/Platform/Log.h>
#include <GeoRaster/Platform/Config.h>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Geo::Raster::Platform {

namespace {

std::shared_ptr<spdlog::logger> CreateLogger() {
    // Reuse a logger the application registered under our name
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }

    const RuntimeConfig& config = GetRuntimeConfig();
    logger->set_level(spdlog::level::from_str(config.logLevel));
    for (const auto& warning : config.warnings) {
        logger->warn("{}", warning);
    }
    return logger;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> Logger() {
    static std::shared_ptr<spdlog::logger> logger = CreateLogger();
    return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
    Logger()->set_level(level);
}

spdlog::level::level_enum GetLogLevel() {
    return Logger()->level();
}

} // namespace Geo::Raster::Platform
