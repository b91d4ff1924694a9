/**
 * @file Config.hpp
 * @brief Engine configuration and its JSON loader
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * Files are loaded with protection against:
 * - Path traversal (canonicalisation, optional allowed directory)
 * - Symlink swaps (O_NOFOLLOW)
 * - Oversized inputs (size cap checked on the open descriptor)
 *
 * Example:
 * @code
 * {
 *   "logging":  { "level": "debug", "console": true, "file": "vigil.log" },
 *   "oracles":  { "overflow": true, "infinite_loop": false },
 *   "disable_defects": false,
 *   "loop_threshold": 1000,
 *   "formula_node_cap": 10000,
 *   "typed_bug": { "mode": "event", "marker_module": "oracle", "marker_event": "Crash" }
 * }
 * @endcode
 */

#pragma once

#ifndef VIGIL_CORE_CONFIG_HPP
#define VIGIL_CORE_CONFIG_HPP

#include <Vigil/Core/Types.hpp>
#include <Vigil/Core/ErrorCodes.hpp>
#include <Vigil/Core/Logger.hpp>
#include <memory>
#include <string>

namespace Vigil::Config {

struct LoggingConfig {
    Core::LogLevel level = Core::LogLevel::Info;
    bool console = true;
    std::string file;                 ///< Empty disables file output
    size_t maxFileSizeMB = 10;
};

enum class TypedBugMode : uint8_t {
    AbortCode,
    Event
};

struct OracleConfig {
    bool boolJudgement = true;
    bool infiniteLoop = true;
    bool precisionLoss = true;
    bool typeConversion = true;
    bool overflow = true;
    bool typedBug = true;

    /// Disables every oracle regardless of the individual flags
    bool disableDefects = false;

    size_t loopThreshold = DEFAULT_LOOP_THRESHOLD;
    size_t formulaNodeCap = DEFAULT_FORMULA_NODE_CAP;

    TypedBugMode typedBugMode = TypedBugMode::AbortCode;
    uint64_t sentinelAbortCode = DEFAULT_SENTINEL_ABORT_CODE;
    std::string markerModule = "oracle";
    std::string markerEvent = "Crash";
};

struct EngineConfig {
    LoggingConfig logging;
    OracleConfig oracles;
};

/**
 * @brief Loads EngineConfig from JSON
 *
 * Absent keys keep their defaults and unknown keys are ignored. A key of
 * the wrong JSON type is InvalidFieldType; a value out of range is
 * InvalidFieldValue.
 */
class ConfigLoader {
public:
    struct Options {
        size_t max_file_size = 1024 * 1024;  // 1MB default
        std::string allowed_directory;       // Restrict to directory
    };

    ConfigLoader();
    explicit ConfigLoader(const Options& options);
    ~ConfigLoader();

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration or error
     */
    Result<EngineConfig> load(const std::string& path);

    /**
     * @brief Load configuration from a JSON document in memory
     */
    Result<EngineConfig> loadFromString(const std::string& json);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Initialise the process-wide logger from configuration
 * @return ConfigInvalid if the logger could not be set up
 */
VoidResult applyLoggingConfig(const LoggingConfig& config);

} // namespace Vigil::Config

#endif // VIGIL_CORE_CONFIG_HPP
