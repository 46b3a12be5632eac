// AMOCA - Time Utilities Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/util/time.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace amoca {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load() * 1000;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Formatting and Parsing
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    if (gmtime_r(&time, &tm_buf) == nullptr) {
        return std::to_string(timestamp);
    }
    
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<int64_t> ParseISO8601(const std::string& str) {
    std::tm tm_buf = {};
    std::istringstream iss(str);
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    char zone = 0;
    if (iss >> zone && zone != 'Z') {
        return std::nullopt;
    }
    return static_cast<int64_t>(timegm(&tm_buf));
}

std::string FormatDuration(int64_t seconds) {
    if (seconds < 0) {
        return "-" + FormatDuration(-seconds);
    }
    if (seconds == 0) {
        return "0s";
    }
    
    int64_t days = seconds / SECONDS_PER_DAY;
    seconds %= SECONDS_PER_DAY;
    int64_t hours = seconds / SECONDS_PER_HOUR;
    seconds %= SECONDS_PER_HOUR;
    int64_t minutes = seconds / SECONDS_PER_MINUTE;
    seconds %= SECONDS_PER_MINUTE;
    
    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (seconds > 0) oss << seconds << "s";
    
    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

std::optional<int64_t> ParseDuration(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    
    int64_t multiplier = 1;
    std::string digits = str;
    switch (std::tolower(static_cast<unsigned char>(str.back()))) {
        case 's': multiplier = 1; break;
        case 'm': multiplier = SECONDS_PER_MINUTE; break;
        case 'h': multiplier = SECONDS_PER_HOUR; break;
        case 'd': multiplier = SECONDS_PER_DAY; break;
        case 'w': multiplier = 7 * SECONDS_PER_DAY; break;
        case 'y': multiplier = SECONDS_PER_YEAR; break;
        default: digits.push_back('s'); break;
    }
    digits.pop_back();
    
    if (digits.empty()) {
        return std::nullopt;
    }
    int64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        if (value > (std::numeric_limits<int64_t>::max() - (c - '0')) / 10) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    if (value > std::numeric_limits<int64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

std::optional<int64_t> ParseInstant(const std::string& str, int64_t now) {
    if (!str.empty() && str[0] == '+') {
        auto duration = ParseDuration(str.substr(1));
        if (!duration || now > std::numeric_limits<int64_t>::max() - *duration) {
            return std::nullopt;
        }
        return now + *duration;
    }
    bool digits = !str.empty() && std::all_of(str.begin(), str.end(),
                                              [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits) {
        return ParseISO8601(str);
    }
    // Epoch seconds, range-checked against int64_t
    return ParseDuration(str);
}

// ============================================================================
// Mock Time
// ============================================================================

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
    g_mockTimeEnabled.store(true);
}

void AdvanceMockTime(int64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

} // namespace util
} // namespace amoca
