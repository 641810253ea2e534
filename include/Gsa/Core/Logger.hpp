/**
 * @file Logger.hpp
 * @brief Logging infrastructure for GsaConf diagnostics
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * Diagnostics go to stderr, and optionally to a rotating log file. Stdout is
 * left to document output.
 */

#pragma once

#ifndef GSA_CORE_LOGGER_HPP
#define GSA_CORE_LOGGER_HPP

#include <spdlog/fwd.h>

#include <string>
#include <string_view>
#include <mutex>
#include <memory>
#include <optional>
#include <cstdio>

namespace Gsa {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,      ///< Canonical bytes and intermediate values
    Debug = 1,      ///< Processing steps
    Info = 2,       ///< Action outcomes
    Warning = 3,    ///< Signature mismatches
    Error = 4,      ///< Failed actions
    Critical = 5,
    Off = 255       ///< Disable all logging
};

/**
 * @brief Process-wide logger used by the core library and the tool
 *
 * Messages logged before Initialize() or after Shutdown() are dropped.
 */
class Logger {
public:
    static Logger& Instance();

    /**
     * @brief Initialize the logger
     * @param minLevel Minimum log level to record
     * @param logFilePath Also write to this file, rotated at maxFileSizeMB
     * @param maxFileSizeMB Maximum log file size in MB before rotation
     * @return true on success, false if already initialized or the log file
     *         cannot be opened
     */
    bool Initialize(LogLevel minLevel = LogLevel::Warning,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Flush and release the sinks
     */
    void Shutdown();

    void SetMinLevel(LogLevel level);

    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Log a message
     * @param file Source file, shown without its directory
     * @param line Source line
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief Log a printf-style formatted message
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) return;

        char buffer[1024];
        int result = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);

        if (result > 0 && static_cast<size_t>(result) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, result));
        } else if (result > 0) {
            // Digests and paths can exceed the stack buffer
            std::string largeBuffer(result + 1, '\0');
            std::snprintf(largeBuffer.data(), largeBuffer.size(), format, std::forward<Args>(args)...);
            largeBuffer.resize(result);
            Log(level, largeBuffer);
        }
    }

    void Flush();

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warning"/"warn",
     *        "error", "critical", "off"), case-insensitive
     */
    static std::optional<LogLevel> ParseLevel(std::string_view name);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);

    LogLevel minLevel_ = LogLevel::Warning;

    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
};

} // namespace Core
} // namespace Gsa

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef GSA_DISABLE_LOGGING

#define GSA_LOG_TRACE(msg) \
    ::Gsa::Core::Logger::Instance().Log(::Gsa::Core::LogLevel::Trace, msg, __FILE__, __LINE__)

#define GSA_LOG_DEBUG(msg) \
    ::Gsa::Core::Logger::Instance().Log(::Gsa::Core::LogLevel::Debug, msg, __FILE__, __LINE__)

#define GSA_LOG_INFO(msg) \
    ::Gsa::Core::Logger::Instance().Log(::Gsa::Core::LogLevel::Info, msg, __FILE__, __LINE__)

#define GSA_LOG_WARNING(msg) \
    ::Gsa::Core::Logger::Instance().Log(::Gsa::Core::LogLevel::Warning, msg, __FILE__, __LINE__)

#define GSA_LOG_ERROR(msg) \
    ::Gsa::Core::Logger::Instance().Log(::Gsa::Core::LogLevel::Error, msg, __FILE__, __LINE__)

#define GSA_LOG_TRACE_F(fmt, ...) \
    ::Gsa::Core::Logger::Instance().LogFormat(::Gsa::Core::LogLevel::Trace, fmt, __VA_ARGS__)

#define GSA_LOG_DEBUG_F(fmt, ...) \
    ::Gsa::Core::Logger::Instance().LogFormat(::Gsa::Core::LogLevel::Debug, fmt, __VA_ARGS__)

#define GSA_LOG_INFO_F(fmt, ...) \
    ::Gsa::Core::Logger::Instance().LogFormat(::Gsa::Core::LogLevel::Info, fmt, __VA_ARGS__)

#define GSA_LOG_WARNING_F(fmt, ...) \
    ::Gsa::Core::Logger::Instance().LogFormat(::Gsa::Core::LogLevel::Warning, fmt, __VA_ARGS__)

#define GSA_LOG_ERROR_F(fmt, ...) \
    ::Gsa::Core::Logger::Instance().LogFormat(::Gsa::Core::LogLevel::Error, fmt, __VA_ARGS__)

#else
#define GSA_LOG_TRACE(msg) ((void)0)
#define GSA_LOG_DEBUG(msg) ((void)0)
#define GSA_LOG_INFO(msg) ((void)0)
#define GSA_LOG_WARNING(msg) ((void)0)
#define GSA_LOG_ERROR(msg) ((void)0)
#define GSA_LOG_TRACE_F(fmt, ...) ((void)0)
#define GSA_LOG_DEBUG_F(fmt, ...) ((void)0)
#define GSA_LOG_INFO_F(fmt, ...) ((void)0)
#define GSA_LOG_WARNING_F(fmt, ...) ((void)0)
#define GSA_LOG_ERROR_F(fmt, ...) ((void)0)
#endif // GSA_DISABLE_LOGGING

#endif // GSA_CORE_LOGGER_HPP
