/**
 * @file SecurityEventLog.cpp
 * @brief Security event log implementation
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/SecurityEventLog.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/Logger.hpp>

#include <algorithm>

namespace Warden::Security {

SecurityEventLog& SecurityEventLog::Instance() {
    static SecurityEventLog instance;
    return instance;
}

void SecurityEventLog::logEvent(std::string_view type, const nlohmann::json& details) {
    SecurityEvent event;
    event.timestamp = WallClock::now();
    event.type = std::string(type);
    event.severity = severityFor(type);
    // Replace invalid UTF-8 instead of throwing
    event.details = sanitizeForLogging(
        details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const Core::LogLevel level = isBlockingSeverity(event.severity)
        ? Core::LogLevel::Warning
        : Core::LogLevel::Info;
    Core::Logger::Instance().LogFormat(level, "[SECURITY EVENT] %s (%s): %s",
                                       event.type.c_str(),
                                       severityToString(event.severity),
                                       event.details.c_str());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(std::move(event));
}

std::vector<SecurityEvent> SecurityEventLog::getEvents() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
}

size_t SecurityEventLog::countEvents(std::string_view type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_events.begin(), m_events.end(),
        [type](const SecurityEvent& event) { return event.type == type; }));
}

void SecurityEventLog::clearEvents() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.clear();
}

Severity SecurityEventLog::severityFor(std::string_view type) noexcept {
    if (type == EventType::CommandInjection) return Severity::Critical;
    if (type == EventType::PathTraversal ||
        type == EventType::MaliciousInput ||
        type == EventType::SsrfBlocked ||
        type == EventType::PackageIntegrityFailure ||
        type == EventType::TarballIntegrityFailure) {
        return Severity::High;
    }
    if (type == EventType::ValidationError) return Severity::Low;
    // rate_limit, policy_violation and unknown types
    return Severity::Medium;
}

} // namespace Warden::Security
