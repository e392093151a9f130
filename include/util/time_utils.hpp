#pragma once

#include <chrono>
#include <string>

namespace relup {

using Clock = std::chrono::system_clock;

// 2026-10-19T18:05:00Z
std::string FormatIso8601Utc(Clock::time_point tp);
// 2026-10-19
std::string FormatDateUtc(Clock::time_point tp);
// 20261019T180500.123456Z, sortable and filesystem safe.
std::string FormatCompactUtc(Clock::time_point tp);

bool ParseIso8601Utc(const std::string& s, Clock::time_point& out);
bool ParseCompactUtc(const std::string& s, Clock::time_point& out);

} // namespace relup
