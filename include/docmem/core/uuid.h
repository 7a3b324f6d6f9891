// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace docmem::core {

/**
 * Generate a UUID v4 string (xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx).
 */
inline std::string generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng);
    uint64_t b = dist(rng);

    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF), static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0x0000FFFFFFFFFFFFull));
    return std::string(buf);
}

/**
 * Generate a sortable execution id: yyyyMMdd.HHmmss.random6chars.
 */
inline std::string generateExecutionId() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc;
    gmtime_r(&time_t_now, &tm_utc);

    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);

    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "%06x", dist(rng));

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y%m%d.%H%M%S") << '.' << suffix;
    return oss.str();
}

inline int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

/**
 * ISO 8601 UTC timestamp with millisecond precision, e.g. 2025-10-01T14:30:00.123Z
 */
inline std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm tm_utc;
    gmtime_r(&time_t_tp, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return oss.str();
}

/**
 * Inverse of formatTimestamp(); epoch on malformed input.
 */
inline std::chrono::system_clock::time_point parseTimestamp(const std::string& text) {
    std::tm tm_utc{};
    int millis = 0;
    int matched = std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d.%dZ", &tm_utc.tm_year,
                              &tm_utc.tm_mon, &tm_utc.tm_mday, &tm_utc.tm_hour, &tm_utc.tm_min,
                              &tm_utc.tm_sec, &millis);
    if (matched < 6) {
        return std::chrono::system_clock::time_point{};
    }
    tm_utc.tm_year -= 1900;
    tm_utc.tm_mon -= 1;
    auto seconds = timegm(&tm_utc);
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

} // namespace docmem::core
