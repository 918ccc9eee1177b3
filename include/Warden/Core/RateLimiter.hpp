/**
 * @file RateLimiter.hpp
 * @brief Sliding-window rate limiter keyed by identifier
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#pragma once

#ifndef WARDEN_CORE_RATE_LIMITER_HPP
#define WARDEN_CORE_RATE_LIMITER_HPP

#include <Warden/Core/Types.hpp>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Warden::Security {

/**
 * @brief Quota for one sliding window
 */
struct RateLimitConfig {
    size_t maxRequests = 3;
    Milliseconds window{1000};

    /// Quota applied to outbound HTTP requests per host
    static RateLimitConfig http() { return RateLimitConfig{10, Milliseconds(60000)}; }
};

/**
 * @brief Sliding-window limiter
 *
 * Each identifier keeps the timestamps of its admitted requests. A
 * timestamp t is retained while now - window < t. Identifiers never share
 * quota. All operations are serialized by an internal mutex, so the
 * check-then-append in isAllowed() is atomic.
 */
class RateLimiter {
public:
    /**
     * @param config Quota and window
     * @param clock Source of "now"; defaults to the steady clock
     */
    explicit RateLimiter(RateLimitConfig config = RateLimitConfig{},
                         ClockFunction clock = nullptr);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * @brief Admit a request for an identifier if it has quota left
     * @return true if admitted (and recorded), false if over quota
     */
    bool isAllowed(std::string_view identifier);

    /**
     * @brief Time until the oldest recorded request leaves the window
     * @return Zero when the identifier has no recorded requests
     */
    [[nodiscard]] Milliseconds getTimeUntilReset(std::string_view identifier) const;

    /// Forget every window
    void reset();

    [[nodiscard]] const RateLimitConfig& config() const noexcept { return m_config; }

private:
    void pruneLocked(TimePoint now);

    RateLimitConfig m_config;
    ClockFunction m_clock;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::deque<TimePoint>> m_windows;
};

} // namespace Warden::Security

#endif // WARDEN_CORE_RATE_LIMITER_HPP
