/**
 * @file Config.cpp
 * @brief Runtime configuration from environment variables
 */

#include <GeoRaster/Platform/Config.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace Geo::Raster::Platform {

namespace {

constexpr const char* LOG_LEVEL_NAMES[] = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

RuntimeConfig ParseRuntimeConfig(const char* numThreads, const char* logLevel) {
    RuntimeConfig config;

    if (numThreads != nullptr && numThreads[0] != '\0') {
        char* end = nullptr;
        long value = std::strtol(numThreads, &end, 10);
        if (end == numThreads || *end != '\0' || value < 1 || value > 1024) {
            config.warnings.push_back(std::string(ENV_NUM_THREADS) + "='" + numThreads +
                                      "' is not a thread count in [1, 1024], using default");
        } else {
            config.numThreads = static_cast<size_t>(value);
        }
    }

    if (logLevel != nullptr && logLevel[0] != '\0') {
        std::string level = ToLower(logLevel);
        if (level == "warning") level = "warn";
        if (level == "err") level = "error";

        bool known = std::any_of(std::begin(LOG_LEVEL_NAMES), std::end(LOG_LEVEL_NAMES),
                                 [&level](const char* name) { return level == name; });
        if (known) {
            config.logLevel = level;
        } else {
            config.warnings.push_back(std::string(ENV_LOG_LEVEL) + "='" + logLevel +
                                      "' is not a log level, using '" + config.logLevel + "'");
        }
    }

    return config;
}

const RuntimeConfig& GetRuntimeConfig() {
    static const RuntimeConfig config =
        ParseRuntimeConfig(std::getenv(ENV_NUM_THREADS), std::getenv(ENV_LOG_LEVEL));
    return config;
}

} // namespace Geo::Raster::Platform
