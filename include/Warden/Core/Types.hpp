/**
 * @file Types.hpp
 * @brief Byte, clock and severity vocabulary shared by every Warden module
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#pragma once

#ifndef WARDEN_CORE_TYPES_HPP
#define WARDEN_CORE_TYPES_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace Warden {

using Byte = uint8_t;
using ByteBuffer = std::vector<Byte>;
using ByteSpan = std::span<const Byte>;

// ============================================================================
// Clocks
// ============================================================================

/// Deadlines, backoff and rate windows run on the monotonic clock
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Milliseconds = std::chrono::milliseconds;

/// Registry timestamps, event timestamps and file mtimes use wall time
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

/// Injectable "now" so tests can pin time
using ClockFunction = std::function<TimePoint()>;
using WallClockFunction = std::function<WallTime()>;

// ============================================================================
// Key Material
// ============================================================================

using SHA256Hash = std::array<Byte, 32>;
using AESKey = std::array<Byte, 32>;     ///< AES-256
using AESNonce = std::array<Byte, 12>;   ///< GCM recommended IV length
using AESTag = std::array<Byte, 16>;

// ============================================================================
// Severity
// ============================================================================

/**
 * @brief Ranking of security events and package integrity issues
 *
 * High and Critical issues make a package unsafe; Low and Medium are
 * reported but do not block.
 */
enum class Severity : uint8_t {
    Low = 1,
    Medium,
    High,
    Critical
};

[[nodiscard]] constexpr const char* severityToString(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:      return "low";
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool isBlockingSeverity(Severity severity) noexcept {
    return severity >= Severity::High;
}

} // namespace Warden

#endif // WARDEN_CORE_TYPES_HPP
