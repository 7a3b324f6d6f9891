// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/core/types.h>

#include <chrono>
#include <functional>

namespace docmem::retry {

/**
 * @brief Capped exponential backoff with a small deterministic jitter.
 *
 * delay(n) = min(base * 2^(n-1) + (n * 37 % 101) ms, max), n >= 1.
 * Shared by queue requeue delays and embedding provider retries.
 */
struct BackoffPolicy {
    std::chrono::milliseconds base{200};
    std::chrono::milliseconds max{5000};

    std::chrono::milliseconds delay(int attempt) const;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Calls @p fn up to @p maxAttempts times while @p isRetryable(error) holds.
 *
 * Sleeps policy.delay(attempt) between attempts. The last error is returned.
 */
template <typename T, typename Fn, typename Pred>
Result<T> callWithRetry(const BackoffPolicy& policy, int maxAttempts, Fn&& fn, Pred&& isRetryable,
                        const Sleeper& sleeper) {
    if (maxAttempts < 1)
        maxAttempts = 1;
    for (int attempt = 1;; ++attempt) {
        Result<T> result = fn();
        if (result || attempt >= maxAttempts || !isRetryable(result.error()))
            return result;
        if (sleeper)
            sleeper(policy.delay(attempt));
    }
}

} // namespace docmem::retry
