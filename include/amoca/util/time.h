// AMOCA - Time Utilities
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - Formatting and parsing of instants and durations
// - Mock time for testing

#ifndef AMOCA_UTIL_TIME_H
#define AMOCA_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace amoca {
namespace util {

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

/// Fixed 365-day year used for annualised yields
constexpr int64_t SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Current Unix timestamp in milliseconds
int64_t GetTimeMillis();

// ============================================================================
// Formatting and Parsing
// ============================================================================

/// Format timestamp as ISO 8601 UTC ("2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Parse "YYYY-MM-DDTHH:MM:SSZ" (UTC); nullopt on failure
std::optional<int64_t> ParseISO8601(const std::string& str);

/// Format duration as human-readable string ("1d 2h 3m 4s")
std::string FormatDuration(int64_t seconds);

/// Parse a duration: plain seconds, or a number with one of the
/// suffixes s, m, h, d, w, y ("90d", "12h"). nullopt on failure.
std::optional<int64_t> ParseDuration(const std::string& str);

/// Parse an instant: ISO 8601, epoch seconds, or "+<duration>" after now.
/// nullopt on failure or when the result does not fit in int64_t.
std::optional<int64_t> ParseInstant(const std::string& str, int64_t now);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

void DisableMockTime();
bool IsMockTimeEnabled();

/// Set mock time (enables mock time)
void SetMockTime(int64_t timestamp);

/// Advance mock time by a number of seconds
void AdvanceMockTime(int64_t seconds);

} // namespace util
} // namespace amoca

#endif // AMOCA_UTIL_TIME_H
