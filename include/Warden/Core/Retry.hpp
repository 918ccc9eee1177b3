/**
 * @file Retry.hpp
 * @brief Bounded retry with exponential backoff and bounded fan-out
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#pragma once

#ifndef WARDEN_CORE_RETRY_HPP
#define WARDEN_CORE_RETRY_HPP

#include <Warden/Core/ErrorCodes.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/Logger.hpp>
#include <Warden/Core/Types.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <system_error>
#include <thread>
#include <vector>

namespace Warden {

/**
 * @brief Delay before the next attempt: baseDelay * 2^(attempt-1)
 * @param attempt 1-based number of the attempt that just failed
 */
[[nodiscard]] inline Milliseconds backoffDelay(Milliseconds baseDelay, unsigned attempt) noexcept {
    const unsigned shift = std::min(attempt > 0 ? attempt - 1 : 0u, 20u);
    return baseDelay * (int64_t{1} << shift);
}

namespace Exec {

/**
 * @brief Call fn until it succeeds, fails terminally, or attempts run out
 *
 * Only failures for which isRetriable() holds are retried. The last result
 * is returned unchanged.
 *
 * @param fn Callable returning a Result
 * @param maxRetries Total number of attempts (at least one is made)
 * @param baseDelay Backoff base
 */
template<typename F>
auto execWithRetry(F&& fn, unsigned maxRetries = 3,
                   Milliseconds baseDelay = Milliseconds(1000)) -> decltype(fn()) {
    const unsigned attempts = std::max(maxRetries, 1u);

    for (unsigned attempt = 1;; ++attempt) {
        auto result = fn();
        if (result.isSuccess() || !isRetriable(result.error()) || attempt >= attempts) {
            return result;
        }
        std::this_thread::sleep_for(backoffDelay(baseDelay, attempt));
    }
}

/**
 * @brief Run every callable with at most maxConcurrency in flight
 *
 * @return One settled Result per callable, in input order. A failure never
 *         stops the remaining calls; a callable that throws settles as
 *         InternalError. If no worker thread can be started the calling
 *         thread drains the remaining work itself.
 */
template<typename F>
auto execBatch(const std::vector<F>& fns, size_t maxConcurrency = 3)
    -> std::vector<decltype(std::declval<const F&>()())> {
    using ResultType = decltype(std::declval<const F&>()());

    std::vector<ResultType> results(fns.size());
    if (fns.empty()) {
        return results;
    }

    const size_t workerCount = std::min(std::max<size_t>(maxConcurrency, 1), fns.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t index = next.fetch_add(1); index < fns.size(); index = next.fetch_add(1)) {
            try {
                results[index] = fns[index]();
            } catch (const std::exception& e) {
                results[index] = makeError(ErrorCode::InternalError, e.what(), "batch");
            } catch (...) {
                results[index] = makeError(ErrorCode::InternalError,
                                           "Batch item threw a non-standard exception", "batch");
            }
        }
    };

    std::vector<std::thread> workers;
    try {
        workers.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        WARDEN_LOG_WARNING_F("Batch running with %zu worker(s): %s", workers.size(), e.what());
    }
    if (workers.empty()) {
        worker();
    }
    for (auto& thread : workers) {
        thread.join();
    }

    return results;
}

} // namespace Exec

} // namespace Warden

#endif // WARDEN_CORE_RETRY_HPP
