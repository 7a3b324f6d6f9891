// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <docmem/retry/backoff.h>

#include <algorithm>

namespace docmem::retry {

std::chrono::milliseconds BackoffPolicy::delay(int attempt) const {
    if (attempt < 1)
        attempt = 1;

    // Cap the shift so large attempt counts cannot overflow
    const int shift = std::min(attempt - 1, 30);
    const long long exponential = static_cast<long long>(base.count()) << shift;
    const long long jitter = (static_cast<long long>(attempt) * 37) % 101;
    const long long capped = std::min<long long>(exponential + jitter, max.count());
    return std::chrono::milliseconds(std::max<long long>(capped, 0));
}

} // namespace docmem::retry
