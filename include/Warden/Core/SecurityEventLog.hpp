/**
 * @file SecurityEventLog.hpp
 * @brief Append-only log of security-relevant events
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#pragma once

#ifndef WARDEN_CORE_SECURITY_EVENT_LOG_HPP
#define WARDEN_CORE_SECURITY_EVENT_LOG_HPP

#include <Warden/Core/Types.hpp>
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace Warden::Security {

/// Event type names recorded by gateway components
namespace EventType {
constexpr const char* CommandInjection = "command_injection";
constexpr const char* PathTraversal = "path_traversal";
constexpr const char* MaliciousInput = "malicious_input";
constexpr const char* RateLimit = "rate_limit";
constexpr const char* ValidationError = "validation_error";
constexpr const char* PolicyViolation = "policy_violation";
constexpr const char* SsrfBlocked = "ssrf_blocked";
constexpr const char* PackageIntegrityFailure = "package_integrity_failure";
constexpr const char* TarballIntegrityFailure = "tarball_integrity_failure";
} // namespace EventType

/**
 * @brief A recorded security event
 */
struct SecurityEvent {
    WallTime timestamp;     ///< When the event was recorded
    std::string type;       ///< Event type name
    Severity severity;      ///< Severity derived from the type
    std::string details;    ///< Redacted JSON rendering of the details
};

/**
 * @brief Thread-safe, append-only security event log
 *
 * Details are serialized and passed through sanitizeForLogging() before
 * they are stored or forwarded to the Logger.
 */
class SecurityEventLog {
public:
    /**
     * @brief Shared log used by components that are not given their own
     */
    static SecurityEventLog& Instance();

    SecurityEventLog() = default;

    SecurityEventLog(const SecurityEventLog&) = delete;
    SecurityEventLog& operator=(const SecurityEventLog&) = delete;

    /**
     * @brief Record an event
     * @param type Event type (see EventType)
     * @param details Structured details; redacted before storage
     */
    void logEvent(std::string_view type, const nlohmann::json& details = nlohmann::json::object());

    /**
     * @brief Snapshot of all recorded events
     */
    [[nodiscard]] std::vector<SecurityEvent> getEvents() const;

    /**
     * @brief Number of recorded events of a given type
     */
    [[nodiscard]] size_t countEvents(std::string_view type) const;

    void clearEvents();

    /**
     * @brief Severity for an event type; unknown types are Medium
     */
    static Severity severityFor(std::string_view type) noexcept;

private:
    mutable std::mutex m_mutex;
    std::vector<SecurityEvent> m_events;
};

} // namespace Warden::Security

#endif // WARDEN_CORE_SECURITY_EVENT_LOG_HPP
