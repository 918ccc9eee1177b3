/**
 * @file ErrorHandler.cpp
 * @brief Redaction boundary implementation
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/Crypto.hpp>
#include <Warden/Core/Logger.hpp>

#include <array>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <regex>

namespace Warden::Security {

namespace {

const std::regex& credentialPattern() {
    // key, separator (optionally JSON-quoted), value
    static const std::regex pattern(
        R"((password|token|api[_-]?key|secret)("?\s*[=:]\s*"?)[^\s&",}]+)",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

bool envFlagSet(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr && *value != '\0' && std::strcmp(value, "0") != 0;
}

} // anonymous namespace

// ============================================================================
// Free Functions
// ============================================================================

std::string maskCredentials(std::string_view value) {
    return std::regex_replace(std::string(value), credentialPattern(), "$1$2***");
}

std::string sanitizeForLogging(std::string_view value) {
    std::string masked = maskCredentials(value);
    if (masked.size() > MAX_REDACTED_LENGTH) {
        masked.resize(MAX_REDACTED_LENGTH);
    }
    return masked;
}

std::string generateErrorId() {
    static Crypto::SecureRandom rng;
    std::array<Byte, 8> bytes{};

    auto result = rng.generate(bytes.data(), bytes.size());
    if (result.isFailure()) {
        // RNG failure degrades to a process-unique id
        static std::atomic<uint64_t> counter{0};
        uint64_t fallback = static_cast<uint64_t>(
            Clock::now().time_since_epoch().count()) ^ (++counter << 48);
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<Byte>((fallback >> (8 * i)) & 0xFF);
        }
        WARDEN_LOG_WARNING("Secure random unavailable for error id generation");
    }

    return Crypto::toHex(bytes);
}

ErrorInfo makeError(ErrorCode code, std::string_view message,
                    std::string_view field, std::string_view rawValue) {
    ErrorInfo info(code);
    if (!message.empty()) {
        info.message = sanitizeForLogging(message);
    }
    info.field = std::string(field);
    if (!rawValue.empty()) {
        info.redactedValue = sanitizeForLogging(rawValue);
    }
    info.correlationId = generateErrorId();
    return info;
}

// ============================================================================
// SecureErrorHandler
// ============================================================================

SecureErrorHandler& SecureErrorHandler::Instance() {
    static SecureErrorHandler instance;
    return instance;
}

SecureErrorHandler::SecureErrorHandler() {
    const char* nodeEnv = std::getenv("NODE_ENV");
    bool development = nodeEnv != nullptr && std::strcmp(nodeEnv, "development") == 0;
    m_debugMode = development || envFlagSet("WARDEN_DEBUG");
}

void SecureErrorHandler::setDebugMode(bool enabled) noexcept {
    m_debugMode = enabled;
}

bool SecureErrorHandler::isDebugMode() const noexcept {
    return m_debugMode;
}

std::string SecureErrorHandler::userMessageFor(const ErrorInfo& error) {
    switch (error.category()) {
        case ErrorCategory::Validation:
            return "Invalid input for " + (error.field.empty() ? std::string("input") : error.field) +
                   ". Please check the format and try again.";

        case ErrorCategory::Policy:
            switch (error.code) {
                case ErrorCode::PathOutsideBase:
                case ErrorCode::SensitivePath:
                case ErrorCode::ExtensionNotAllowed:
                    return "Invalid file path detected. Operation blocked for security.";
                case ErrorCode::CommandNotAllowed:
                case ErrorCode::SubcommandNotAllowed:
                    return "Invalid command detected. Operation blocked for security.";
                case ErrorCode::SchemeNotAllowed:
                case ErrorCode::HostNotAllowed:
                case ErrorCode::PrivateAddress:
                    return "Request blocked by network security policy.";
                default:
                    return "Operation blocked by security policy.";
            }

        case ErrorCategory::RateLimit:
            return "Too many requests. Please wait before trying again.";

        case ErrorCategory::Resource:
            if (error.code == ErrorCode::Timeout) {
                return "The operation timed out. Please try again.";
            }
            return "The operation exceeded resource limits.";

        case ErrorCategory::Network:
            return "A network error occurred. Please try again later.";

        case ErrorCategory::Integrity:
            return "Data integrity verification failed.";

        default:
            return "An unexpected error occurred. Please try again.";
    }
}

HandledError SecureErrorHandler::handle(const ErrorInfo& error, std::string_view context) {
    HandledError handled;
    handled.userMessage = userMessageFor(error);
    handled.errorId = error.correlationId.empty() ? generateErrorId() : error.correlationId;

    std::string ctx = sanitizeForLogging(context.empty() ? std::string_view("operation") : context);

    WARDEN_LOG_WARNING_F("%s failed [errorId=%s] %s",
                         ctx.c_str(), handled.errorId.c_str(), handled.userMessage.c_str());

    if (m_debugMode) {
        handled.detail = std::string(getCategoryName(error.category())) + ": " +
                         sanitizeForLogging(error.message);
        if (!error.field.empty()) {
            handled.detail += " (field: " + error.field + ")";
        }
        if (!error.redactedValue.empty()) {
            handled.detail += " value: " + error.redactedValue;
        }
        WARDEN_LOG_DEBUG_F("[errorId=%s] %s", handled.errorId.c_str(), handled.detail.c_str());
    }

    return handled;
}

} // namespace Warden::Security
