/**
 * @file ErrorCodes.hpp
 * @brief Error codes, ErrorInfo and the Result<T> return type
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * Every fallible Warden operation returns Result<T>. A failure carries an
 * ErrorInfo so the rejecting rule, the offending field and any retry hint
 * survive propagation up to SecureErrorHandler.
 */

#pragma once

#ifndef WARDEN_CORE_ERROR_CODES_HPP
#define WARDEN_CORE_ERROR_CODES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace Warden {

/// High byte of every ErrorCode
enum class ErrorCategory : uint8_t {
    None       = 0x00,
    System     = 0x01,
    Validation = 0x02,  ///< Untrusted input rejected by InputValidator
    Policy     = 0x03,  ///< Well-formed but forbidden (whitelists, sensitive paths)
    Resource   = 0x04,  ///< Time or size cap exceeded
    RateLimit  = 0x05,
    Network    = 0x06,
    Process    = 0x07,
    Crypto     = 0x08,
    Integrity  = 0x09,  ///< Tag, hash or blob shape check failed
    Config     = 0x0A,
    IO         = 0x0B,
    Parse      = 0x0C,
    Internal   = 0xFF
};

enum class ErrorCode : uint16_t {
    Success = 0x0000,

    // System
    SystemError = 0x0100,
    AllocationFailed,
    Cancelled,

    // Validation
    ValidationError = 0x0200,
    EmptyInput,
    InputTooLong,
    DangerousPattern,
    InvalidFormat,
    ReservedPrefix,         ///< Package names starting with node_modules, .git, .env or a system dir
    InvalidUrl,

    // Policy
    PolicyViolation = 0x0300,
    CommandNotAllowed,
    SubcommandNotAllowed,
    PathOutsideBase,
    SensitivePath,
    ExtensionNotAllowed,
    SchemeNotAllowed,
    HostNotAllowed,
    PrivateAddress,         ///< Loopback, RFC 1918 or link-local host

    // Resource
    Timeout = 0x0401,
    OutputTooLarge,
    ResponseTooLarge,

    RateLimited = 0x0500,

    // Network
    ConnectionFailed = 0x0601,
    ConnectionReset,
    DnsResolutionFailed,
    TlsHandshakeFailed,
    CertificateInvalid,
    HttpRequestFailed,
    HttpStatusError,        ///< 4xx; never retried
    ServerError,            ///< 5xx; retried with backoff
    TlsVersionTooOld,
    CurlInitFailed,
    TransferAborted,

    // Process
    ProcessError = 0x0700,
    SpawnFailed,
    KilledBySignal,
    PipeFailed,

    // Crypto
    CryptoError = 0x0800,
    EncryptionFailed,
    DecryptionFailed,
    HashFailed,
    InvalidKey,
    RandomGenerationFailed,
    KeyNotLoaded,

    // Integrity
    IntegrityError = 0x0900, ///< Malformed encrypted blob
    AuthenticationFailed,    ///< GCM tag rejected: wrong key or tampered data
    UnsupportedAlgorithm,
    HashMismatch,

    // Config
    ConfigInvalid = 0x0A02,
    ConfigFileNotFound,
    ConfigParseFailed,

    // IO
    IOError = 0x0B00,
    FileNotFound,
    FileAccessDenied,
    FileReadError = 0x0B04,
    FileWriteError,
    FileTooLarge,
    InvalidPath,
    AccessDenied,

    // Parse
    JsonParseFailed = 0x0C01,
    JsonInvalid,
    MissingField,
    InvalidHexString = 0x0C05,
    InvalidBase64,
    InvalidTimestamp,

    // Internal
    InternalError = 0xFF00,
    InvalidState,
    InvalidArgument = 0xFF03,
};

[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>(static_cast<uint16_t>(code) >> 8);
}

/**
 * @brief Whether an operation failing with this code may be retried
 *
 * Only transient transport and process failures qualify. A 4xx answer,
 * a certificate problem or a caller abort will fail the same way again.
 */
[[nodiscard]] constexpr bool isRetriable(ErrorCode code) noexcept {
    switch (getErrorCategory(code)) {
        case ErrorCategory::Network:
            return code != ErrorCode::HttpStatusError &&
                   code != ErrorCode::TransferAborted &&
                   code != ErrorCode::CertificateInvalid &&
                   code != ErrorCode::TlsVersionTooOld &&
                   code != ErrorCode::CurlInitFailed;
        case ErrorCategory::Process:
        case ErrorCategory::System:
        case ErrorCategory::IO:
        case ErrorCategory::Internal:
            return code != ErrorCode::Cancelled;
        default:
            return false;
    }
}

/// Default message for a code, used when no specific message is supplied
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// ErrorInfo
// ============================================================================

/**
 * @brief Details attached to a failed Result
 *
 * Messages describe the rule that rejected an input, never the input itself.
 * Values that must be reported are stored already redacted.
 */
struct ErrorInfo {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    std::string field;                        ///< Offending field, if any
    std::string redactedValue;                ///< Masked and truncated value
    std::chrono::milliseconds retryAfter{0};  ///< Set for RateLimited
    std::string correlationId;

    ErrorInfo() = default;

    ErrorInfo(ErrorCode errorCode)
        : code(errorCode), message(getErrorMessage(errorCode)) {}

    ErrorInfo(ErrorCode errorCode, std::string text)
        : code(errorCode), message(std::move(text)) {}

    [[nodiscard]] ErrorCategory category() const noexcept {
        return getErrorCategory(code);
    }
};

// ============================================================================
// Result
// ============================================================================

/**
 * @brief Either a T or an ErrorInfo
 *
 * Converts implicitly from T, ErrorCode and ErrorInfo so that functions can
 * `return value;` or `return ErrorCode::Timeout;`. Reading the wrong side
 * throws std::logic_error; that is a programming error, not a runtime one.
 *
 * @example
 * ```cpp
 * Result<std::string> loadName(const Path& path) {
 *     std::string text;
 *     WARDEN_TRY_ASSIGN(text, readFile(path));
 *     if (text.empty()) return ErrorCode::EmptyInput;
 *     return text;
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result() : m_data(ErrorInfo(ErrorCode::InternalError)) {}
    Result(const T& value) : m_data(value) {}
    Result(T&& value) : m_data(std::move(value)) {}
    Result(ErrorCode error) : m_data(ErrorInfo(error)) {}
    Result(ErrorInfo error) : m_data(std::move(error)) {}

    [[nodiscard]] bool isSuccess() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool isFailure() const noexcept { return m_data.index() == 1; }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(); }

    [[nodiscard]] T& value() & {
        requireValue();
        return std::get<0>(m_data);
    }

    [[nodiscard]] const T& value() const & {
        requireValue();
        return std::get<0>(m_data);
    }

    [[nodiscard]] T&& value() && {
        requireValue();
        return std::get<0>(std::move(m_data));
    }

    [[nodiscard]] T valueOr(T fallback) const & {
        return isSuccess() ? std::get<0>(m_data) : std::move(fallback);
    }

    [[nodiscard]] ErrorCode error() const { return errorInfo().code; }

    [[nodiscard]] const ErrorInfo& errorInfo() const {
        if (isSuccess()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<1>(m_data);
    }

    /// Apply @p func to the value; failures pass through unchanged
    template<typename F>
    [[nodiscard]] auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>> {
        if (isFailure()) {
            return std::get<1>(m_data);
        }
        return std::forward<F>(func)(std::get<0>(m_data));
    }

private:
    void requireValue() const {
        if (isFailure()) {
            throw std::logic_error("Result holds an error: " + std::get<1>(m_data).message);
        }
    }

    std::variant<T, ErrorInfo> m_data;
};

/// Success carries nothing; `return {};` reports it
template<>
class Result<void> {
public:
    Result() = default;

    Result(ErrorCode error) {
        if (error != ErrorCode::Success) {
            m_error = ErrorInfo(error);
        }
    }

    Result(ErrorInfo error) : m_error(std::move(error)) {}

    [[nodiscard]] bool isSuccess() const noexcept { return !m_error; }
    [[nodiscard]] bool isFailure() const noexcept { return m_error.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(); }

    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error ? m_error->code : ErrorCode::Success;
    }

    [[nodiscard]] const ErrorInfo& errorInfo() const {
        if (!m_error) {
            throw std::logic_error("Result<void> holds no error");
        }
        return *m_error;
    }

private:
    std::optional<ErrorInfo> m_error;
};

/// Propagate the failure of @p expr to the caller
#define WARDEN_TRY(expr) \
    do { \
        auto wardenTry_ = (expr); \
        if (wardenTry_.isFailure()) return wardenTry_.errorInfo(); \
    } while (0)

/**
 * @brief Assign the value of @p expr to @p var, or propagate its failure
 *
 * @p var must be a plain identifier: it is pasted into a local name.
 */
#define WARDEN_TRY_ASSIGN(var, expr) \
    auto wardenTry_##var = (expr); \
    if (wardenTry_##var.isFailure()) return wardenTry_##var.errorInfo(); \
    var = std::move(wardenTry_##var).value()

} // namespace Warden

#endif // WARDEN_CORE_ERROR_CODES_HPP
