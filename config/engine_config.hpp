#ifndef TOKENVAULT_CONFIG_ENGINE_CONFIG_HPP
#define TOKENVAULT_CONFIG_ENGINE_CONFIG_HPP

#include <cstdint>
#include <string>

/**
 * @file engine_config.hpp
 * @brief Runtime settings for a TokenVault engine instance.
 *
 * USAGE:
 *   - Populated with defaults, then optionally by util::ConfigParser from a
 *     key=value file.
 */

namespace tokenvault {
namespace config {

/**
 * @struct EngineConfig
 * @brief Holds the settings read at start-up:
 *   - registryPath: SQLite file backing the consistent token registry.
 *   - defaultPolicy / defaultRegion: used when a caller names neither.
 *   - workerThreads: batch worker pool size (0 = hardware concurrency).
 *   - logLevel / logFile: logger setup.
 *   - detectorEndpoint: remote detection service URL, empty for the local
 *     pattern detector.
 */
struct EngineConfig
{
    /**
     * @brief Construct with defaults:
     *   registryPath = "./tokenvault_registry.sqlite"
     *   defaultPolicy = "basic"
     *   workerThreads = 0
     *   logLevel = "info"
     *   detectorTimeoutSeconds = 30
     *   detectorOffsetUnit = "codepoint"
     */
    EngineConfig()
        : registryPath("./tokenvault_registry.sqlite"),
          defaultPolicy("basic"),
          defaultRegion(""),
          workerThreads(0),
          logLevel("info"),
          logFile(""),
          detectorEndpoint(""),
          detectorTimeoutSeconds(30),
          detectorOffsetUnit("codepoint"),
          valueSearchWordBoundary(true)
    {
    }

    /// SQLite database holding registry entries and per-type counters.
    std::string registryPath;

    /// Policy applied when a request carries neither a policy name nor a type list.
    std::string defaultPolicy;

    /// Region tag used to route detection when the request has none ("eu", "us", ...).
    std::string defaultRegion;

    /// Batch worker threads.
    uint32_t workerThreads;

    /// Minimal log level name ("debug", "info", "warn", "error", "critical").
    std::string logLevel;

    /// Optional log file; empty keeps console logging only.
    std::string logFile;

    /// Remote detection service URL.
    std::string detectorEndpoint;

    /// Per-request timeout for the remote detector.
    uint32_t detectorTimeoutSeconds;

    /// Unit of offsets returned by the remote detector: "codepoint" or "byte".
    std::string detectorOffsetUnit;

    /// Require non-alphanumeric neighbours when matching known values by search.
    bool valueSearchWordBoundary;
};

} // namespace config
} // namespace tokenvault

#endif // TOKENVAULT_CONFIG_ENGINE_CONFIG_HPP
