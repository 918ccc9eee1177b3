/**
 * @file Logger.hpp
 * @brief Diagnostic logging for the gateway components
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * Process-wide logger backed by spdlog. Every message passes through
 * Security::maskCredentials() before it reaches a sink, so tokens and
 * passwords that slip into a message are never written out.
 */

#pragma once

#ifndef WARDEN_CORE_LOGGER_HPP
#define WARDEN_CORE_LOGGER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace Warden {
namespace Core {

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,   ///< Blocked attacks and integrity failures
    Off = 255
};

/**
 * @brief Sink selection, combinable with |
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< stdout, colored
    File = 1 << 1,      ///< Rotating file
    Callback = 1 << 2,  ///< SetCallback() target
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Level from a configuration name
 *
 * Accepts trace, debug, info, warn/warning, error, critical and off in any
 * case. Anything else is Info.
 */
LogLevel ParseLogLevel(std::string_view name);

/// Receives the masked message of every record at or above the minimum level
using LogCallback = std::function<void(LogLevel level, std::string_view message,
                                       std::chrono::system_clock::time_point timestamp)>;

class Logger {
public:
    static Logger& Instance();

    /**
     * @brief Create the sinks and start accepting messages
     * @param minLevel Records below this level are dropped
     * @param outputs Sinks to create; console when None
     * @param logFilePath File sink path, parent directories are created
     * @param maxFileSizeMB Rotation size; three rotated files are kept
     * @return false if already initialized or a sink could not be opened
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /// Flush and close all sinks. Initialize() may be called again afterwards.
    void Shutdown();

    void SetMinLevel(LogLevel level);
    [[nodiscard]] LogLevel GetMinLevel() const;
    void SetCallback(LogCallback callback);

    [[nodiscard]] bool IsInitialized() const;
    [[nodiscard]] bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Record a message
     *
     * With a source location the message is prefixed by "(file:line)".
     * Messages below the minimum level, or sent while the logger is not
     * initialized, only increment the dropped counter.
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /// printf-style variant of Log(); long results are not truncated
    void LogFormat(LogLevel level, const char* format, ...)
        __attribute__((format(printf, 3, 4)));

    void Flush();

    struct Statistics {
        size_t trace = 0;
        size_t debug = 0;
        size_t info = 0;
        size_t warning = 0;
        size_t error = 0;
        size_t critical = 0;
        size_t dropped = 0;
    };

    [[nodiscard]] Statistics GetStatistics() const;
    void ResetStatistics();

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Core
} // namespace Warden

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef WARDEN_DISABLE_LOGGING

#define WARDEN_LOG_AT(level, msg) \
    ::Warden::Core::Logger::Instance().Log(::Warden::Core::LogLevel::level, msg, __FILE__, __LINE__)

#define WARDEN_LOG_TRACE(msg)    WARDEN_LOG_AT(Trace, msg)
#define WARDEN_LOG_DEBUG(msg)    WARDEN_LOG_AT(Debug, msg)
#define WARDEN_LOG_INFO(msg)     WARDEN_LOG_AT(Info, msg)
#define WARDEN_LOG_WARNING(msg)  WARDEN_LOG_AT(Warning, msg)
#define WARDEN_LOG_ERROR(msg)    WARDEN_LOG_AT(Error, msg)
#define WARDEN_LOG_CRITICAL(msg) WARDEN_LOG_AT(Critical, msg)

#define WARDEN_LOG_FORMAT_AT(level, fmt, ...) \
    ::Warden::Core::Logger::Instance().LogFormat(::Warden::Core::LogLevel::level, fmt, __VA_ARGS__)

#define WARDEN_LOG_DEBUG_F(fmt, ...)   WARDEN_LOG_FORMAT_AT(Debug, fmt, __VA_ARGS__)
#define WARDEN_LOG_INFO_F(fmt, ...)    WARDEN_LOG_FORMAT_AT(Info, fmt, __VA_ARGS__)
#define WARDEN_LOG_WARNING_F(fmt, ...) WARDEN_LOG_FORMAT_AT(Warning, fmt, __VA_ARGS__)
#define WARDEN_LOG_ERROR_F(fmt, ...)   WARDEN_LOG_FORMAT_AT(Error, fmt, __VA_ARGS__)

#else
#define WARDEN_LOG_TRACE(msg) ((void)0)
#define WARDEN_LOG_DEBUG(msg) ((void)0)
#define WARDEN_LOG_INFO(msg) ((void)0)
#define WARDEN_LOG_WARNING(msg) ((void)0)
#define WARDEN_LOG_ERROR(msg) ((void)0)
#define WARDEN_LOG_CRITICAL(msg) ((void)0)
#define WARDEN_LOG_DEBUG_F(fmt, ...) ((void)0)
#define WARDEN_LOG_INFO_F(fmt, ...) ((void)0)
#define WARDEN_LOG_WARNING_F(fmt, ...) ((void)0)
#define WARDEN_LOG_ERROR_F(fmt, ...) ((void)0)
#endif // WARDEN_DISABLE_LOGGING

#endif // WARDEN_CORE_LOGGER_HPP
