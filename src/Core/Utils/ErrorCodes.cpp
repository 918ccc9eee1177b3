/**
 * @file ErrorCodes.cpp
 * @brief Human-readable messages for Warden error codes
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/ErrorCodes.hpp>

namespace Warden {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:               return "Success";

        case ErrorCode::SystemError:           return "System error";
        case ErrorCode::AllocationFailed:      return "Memory allocation failed";
        case ErrorCode::Cancelled:             return "Operation cancelled";

        case ErrorCode::ValidationError:       return "Invalid input";
        case ErrorCode::EmptyInput:            return "Input must not be empty";
        case ErrorCode::InputTooLong:          return "Input exceeds maximum length";
        case ErrorCode::DangerousPattern:      return "Dangerous pattern detected";
        case ErrorCode::InvalidFormat:         return "Input has an invalid format";
        case ErrorCode::ReservedPrefix:        return "Input uses a reserved prefix";
        case ErrorCode::InvalidUrl:            return "Invalid URL format";

        case ErrorCode::PolicyViolation:       return "Operation blocked by security policy";
        case ErrorCode::CommandNotAllowed:     return "Command is not allowed";
        case ErrorCode::SubcommandNotAllowed:  return "Subcommand is not allowed";
        case ErrorCode::PathOutsideBase:       return "Path traversal detected";
        case ErrorCode::SensitivePath:         return "Access to sensitive path denied";
        case ErrorCode::ExtensionNotAllowed:   return "File extension not allowed";
        case ErrorCode::SchemeNotAllowed:      return "Only HTTPS URLs are allowed";
        case ErrorCode::HostNotAllowed:        return "Domain not in whitelist";
        case ErrorCode::PrivateAddress:        return "Private IP addresses not allowed";

        case ErrorCode::Timeout:               return "Operation timed out";
        case ErrorCode::OutputTooLarge:        return "Command output too large";
        case ErrorCode::ResponseTooLarge:      return "Response too large";

        case ErrorCode::RateLimited:           return "Rate limit exceeded";

        case ErrorCode::ConnectionFailed:      return "Connection failed";
        case ErrorCode::ConnectionReset:       return "Connection reset";
        case ErrorCode::DnsResolutionFailed:   return "DNS resolution failed";
        case ErrorCode::TlsHandshakeFailed:    return "TLS handshake failed";
        case ErrorCode::CertificateInvalid:    return "Certificate validation failed";
        case ErrorCode::HttpRequestFailed:     return "HTTP request failed";
        case ErrorCode::HttpStatusError:       return "HTTP request rejected by server";
        case ErrorCode::ServerError:           return "Server error";
        case ErrorCode::TlsVersionTooOld:      return "TLS version too old";
        case ErrorCode::CurlInitFailed:        return "HTTP transport initialization failed";
        case ErrorCode::TransferAborted:       return "Transfer aborted";

        case ErrorCode::ProcessError:          return "Process error";
        case ErrorCode::SpawnFailed:           return "Failed to start process";
        case ErrorCode::KilledBySignal:        return "Process terminated by signal";
        case ErrorCode::PipeFailed:            return "Failed to create process pipes";

        case ErrorCode::CryptoError:           return "Cryptographic error";
        case ErrorCode::EncryptionFailed:      return "Encryption failed";
        case ErrorCode::DecryptionFailed:      return "Decryption failed";
        case ErrorCode::HashFailed:            return "Hash computation failed";
        case ErrorCode::InvalidKey:            return "Invalid key";
        case ErrorCode::RandomGenerationFailed:return "Random generation failed";
        case ErrorCode::KeyNotLoaded:          return "Encryption key not loaded";

        case ErrorCode::IntegrityError:        return "Malformed encrypted data";
        case ErrorCode::AuthenticationFailed:  return "Authentication tag verification failed";
        case ErrorCode::UnsupportedAlgorithm:  return "Unsupported encryption algorithm";
        case ErrorCode::HashMismatch:          return "Hash mismatch";

        case ErrorCode::ConfigInvalid:         return "Invalid configuration value";
        case ErrorCode::ConfigFileNotFound:    return "Configuration file not found";
        case ErrorCode::ConfigParseFailed:     return "Configuration parse error";

        case ErrorCode::IOError:               return "I/O error";
        case ErrorCode::FileNotFound:          return "File not found";
        case ErrorCode::FileAccessDenied:      return "File access denied";
        case ErrorCode::FileReadError:         return "File read error";
        case ErrorCode::FileWriteError:        return "File write error";
        case ErrorCode::FileTooLarge:          return "File too large";
        case ErrorCode::InvalidPath:           return "Invalid file path";
        case ErrorCode::AccessDenied:          return "Access denied";

        case ErrorCode::JsonParseFailed:       return "Invalid JSON response format";
        case ErrorCode::JsonInvalid:           return "Unexpected JSON structure";
        case ErrorCode::MissingField:          return "Missing required field";
        case ErrorCode::InvalidHexString:      return "Invalid hex string";
        case ErrorCode::InvalidBase64:         return "Invalid base64 string";
        case ErrorCode::InvalidTimestamp:      return "Invalid timestamp";

        case ErrorCode::InternalError:         return "Internal error";
        case ErrorCode::InvalidState:          return "Invalid state";
        case ErrorCode::InvalidArgument:       return "Invalid argument";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:       return "None";
        case ErrorCategory::System:     return "System";
        case ErrorCategory::Validation: return "Validation";
        case ErrorCategory::Policy:     return "Policy";
        case ErrorCategory::Resource:   return "Resource";
        case ErrorCategory::RateLimit:  return "RateLimit";
        case ErrorCategory::Network:    return "Network";
        case ErrorCategory::Process:    return "Process";
        case ErrorCategory::Crypto:     return "Crypto";
        case ErrorCategory::Integrity:  return "Integrity";
        case ErrorCategory::Config:     return "Config";
        case ErrorCategory::IO:         return "IO";
        case ErrorCategory::Parse:      return "Parse";
        case ErrorCategory::Internal:   return "Internal";
    }
    return "Unknown";
}

} // namespace Warden
