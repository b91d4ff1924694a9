/**
 * @file Logger.hpp
 * @brief Logging infrastructure for Vigil diagnostics
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * Thread-safe logging facade over spdlog with severity filtering, file
 * rotation and per-level statistics. Every engine component logs through
 * the VIGIL_LOG_* macros below.
 */

#pragma once

#ifndef VIGIL_CORE_LOGGER_HPP
#define VIGIL_CORE_LOGGER_HPP

#include <string>
#include <string_view>
#include <mutex>
#include <memory>
#include <cstdio>
#include <cstdint>

#include <spdlog/spdlog.h>

namespace Vigil {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,      ///< Per-event tracing
    Debug = 1,      ///< Debug information for development
    Info = 2,       ///< General informational messages
    Warning = 3,    ///< Warning messages for potential issues
    Error = 4,      ///< Error messages for failures
    Critical = 5,   ///< Critical events requiring immediate attention
    Off = 255       ///< Disable all logging
};

/**
 * @brief Log output targets
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Output to console/stdout
    File = 1 << 1       ///< Output to rotating file
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error",
 *        "critical", "off")
 * @return false if the name is not recognised
 */
bool ParseLogLevel(std::string_view name, LogLevel& out);

/**
 * @brief Thread-safe logging system for Vigil
 *
 * Features:
 * - Multiple severity levels with filtering
 * - Thread-safe file and console output
 * - Automatic log file rotation
 * - Timestamp and thread ID tracking
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& Instance();

    /**
     * @brief Initialize the logger
     * @param minLevel Minimum log level to record
     * @param outputs Output targets (console, file)
     * @param logFilePath Path to log file (required if File output enabled)
     * @param maxFileSizeMB Maximum log file size in MB before rotation
     * @return true on success
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Shutdown the logger and flush all buffers
     */
    void Shutdown();

    /**
     * @brief Check if a log level is enabled
     */
    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Log a message at the specified level
     * @param level Severity level
     * @param message Message text
     * @param file Source file name (optional)
     * @param line Source line number (optional)
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief Log a formatted message
     * @param level Severity level
     * @param format Printf-style format string
     * @param args Format arguments
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) return;

        char buffer[1024];
        int result = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);

        if (result > 0 && static_cast<size_t>(result) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, result));
        } else if (result > 0) {
            std::string largeBuffer(result + 1, '\0');
            std::snprintf(largeBuffer.data(), largeBuffer.size(), format, std::forward<Args>(args)...);
            largeBuffer.resize(result);
            Log(level, largeBuffer);
        }
    }

    /**
     * @brief Flush all buffers to disk
     */
    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);

    LogLevel minLevel_ = LogLevel::Info;
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    bool initialized_ = false;
};

} // namespace Core
} // namespace Vigil

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef VIGIL_DISABLE_LOGGING

#define VIGIL_LOG_DEBUG(msg) \
    ::Vigil::Core::Logger::Instance().Log(::Vigil::Core::LogLevel::Debug, msg, __FILE__, __LINE__)

#define VIGIL_LOG_ERROR(msg) \
    ::Vigil::Core::Logger::Instance().Log(::Vigil::Core::LogLevel::Error, msg, __FILE__, __LINE__)

#define VIGIL_LOG_DEBUG_F(fmt, ...) \
    ::Vigil::Core::Logger::Instance().LogFormat(::Vigil::Core::LogLevel::Debug, fmt, __VA_ARGS__)

#define VIGIL_LOG_INFO_F(fmt, ...) \
    ::Vigil::Core::Logger::Instance().LogFormat(::Vigil::Core::LogLevel::Info, fmt, __VA_ARGS__)

#define VIGIL_LOG_WARNING_F(fmt, ...) \
    ::Vigil::Core::Logger::Instance().LogFormat(::Vigil::Core::LogLevel::Warning, fmt, __VA_ARGS__)

#define VIGIL_LOG_ERROR_F(fmt, ...) \
    ::Vigil::Core::Logger::Instance().LogFormat(::Vigil::Core::LogLevel::Error, fmt, __VA_ARGS__)

#else
#define VIGIL_LOG_DEBUG(msg) ((void)0)
#define VIGIL_LOG_ERROR(msg) ((void)0)
#define VIGIL_LOG_DEBUG_F(fmt, ...) ((void)0)
#define VIGIL_LOG_INFO_F(fmt, ...) ((void)0)
#define VIGIL_LOG_WARNING_F(fmt, ...) ((void)0)
#define VIGIL_LOG_ERROR_F(fmt, ...) ((void)0)
#endif // VIGIL_DISABLE_LOGGING

#endif // VIGIL_CORE_LOGGER_HPP
