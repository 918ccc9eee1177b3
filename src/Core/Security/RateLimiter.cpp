/**
 * @file RateLimiter.cpp
 * @brief Sliding-window rate limiter implementation
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/RateLimiter.hpp>

#include <algorithm>

namespace Warden::Security {

RateLimiter::RateLimiter(RateLimitConfig config, ClockFunction clock)
    : m_config(config)
    , m_clock(clock ? std::move(clock) : ClockFunction([] { return Clock::now(); })) {}

void RateLimiter::pruneLocked(TimePoint now) {
    const TimePoint cutoff = now - m_config.window;

    for (auto it = m_windows.begin(); it != m_windows.end();) {
        auto& stamps = it->second;
        while (!stamps.empty() && stamps.front() <= cutoff) {
            stamps.pop_front();
        }
        if (stamps.empty()) {
            it = m_windows.erase(it);
        } else {
            ++it;
        }
    }
}

bool RateLimiter::isAllowed(std::string_view identifier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const TimePoint now = m_clock();
    pruneLocked(now);

    auto& stamps = m_windows[std::string(identifier)];
    if (stamps.size() >= m_config.maxRequests) {
        return false;
    }

    stamps.push_back(now);
    return true;
}

Milliseconds RateLimiter::getTimeUntilReset(std::string_view identifier) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_windows.find(std::string(identifier));
    if (it == m_windows.end() || it->second.empty()) {
        return Milliseconds(0);
    }

    const auto remaining = std::chrono::duration_cast<Milliseconds>(
        it->second.front() + m_config.window - m_clock());
    return std::max(remaining, Milliseconds(0));
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_windows.clear();
}

} // namespace Warden::Security
