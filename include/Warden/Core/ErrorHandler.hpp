/**
 * @file ErrorHandler.hpp
 * @brief Redaction boundary for errors leaving the gateway
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * Every error returned from a public Warden operation is built with
 * makeError(): credential-like substrings are masked, text is capped at
 * 200 characters and a random correlation id is attached. The
 * SecureErrorHandler turns such errors into user-facing messages and only
 * exposes the full detail in debug mode.
 */

#pragma once

#ifndef WARDEN_CORE_ERROR_HANDLER_HPP
#define WARDEN_CORE_ERROR_HANDLER_HPP

#include <Warden/Core/ErrorCodes.hpp>
#include <atomic>
#include <string>
#include <string_view>

namespace Warden::Security {

/// Maximum length of any redacted string
constexpr size_t MAX_REDACTED_LENGTH = 200;

/**
 * @brief Mask credential-like values without truncating
 *
 * Applied by the logger to every message it emits.
 */
std::string maskCredentials(std::string_view value);

/**
 * @brief Mask credential-like values and truncate
 *
 * Masks the value after `password`, `token`, `api_key`/`apikey`/`api-key`
 * and `secret` when followed by `=` or `:` (JSON-quoted keys included), then
 * truncates to MAX_REDACTED_LENGTH characters.
 */
std::string sanitizeForLogging(std::string_view value);

/**
 * @brief 16 hex characters from 8 random bytes
 */
std::string generateErrorId();

/**
 * @brief Build a redacted error
 * @param code Error code
 * @param message Rule description; defaults to the code's message
 * @param field Offending field name, if any
 * @param rawValue Offending value; stored only in redacted form
 */
ErrorInfo makeError(ErrorCode code,
                    std::string_view message = {},
                    std::string_view field = {},
                    std::string_view rawValue = {});

/**
 * @brief User-facing result of handling an error
 */
struct HandledError {
    std::string userMessage;  ///< Safe message for display
    std::string errorId;      ///< Correlation id
    std::string detail;       ///< Full detail, only populated in debug mode
    bool handled = true;
};

/**
 * @brief Converts internal errors into safe user-facing reports
 */
class SecureErrorHandler {
public:
    /**
     * @brief Shared handler; debug mode initialised from WARDEN_DEBUG
     *        or NODE_ENV=development
     */
    static SecureErrorHandler& Instance();

    SecureErrorHandler();

    void setDebugMode(bool enabled) noexcept;

    [[nodiscard]] bool isDebugMode() const noexcept;

    /**
     * @brief Map an error to a user message and log it
     * @param error Error to report
     * @param context Short description of the failing operation
     */
    HandledError handle(const ErrorInfo& error, std::string_view context = {});

    /**
     * @brief User message for an error category
     */
    static std::string userMessageFor(const ErrorInfo& error);

private:
    std::atomic<bool> m_debugMode{false};
};

} // namespace Warden::Security

namespace Warden {

// Every component builds its failures through these
using Security::makeError;
using Security::sanitizeForLogging;

} // namespace Warden

#endif // WARDEN_CORE_ERROR_HANDLER_HPP
