#include "util/time_utils.hpp"

#include <cinttypes>
#include <cstdio>
#include <ctime>

namespace relup {

namespace {

bool ToUtcTm(Clock::time_point tp, std::tm& out) {
    const std::time_t t = Clock::to_time_t(tp);
    return gmtime_r(&t, &out) != nullptr;
}

bool FromUtcTm(std::tm& tm, Clock::time_point& out) {
    tm.tm_isdst = 0;
    const std::time_t t = ::timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return false;
    out = Clock::from_time_t(t);
    return true;
}

} // namespace

std::string FormatIso8601Utc(Clock::time_point tp) {
    std::tm tm{};
    if (!ToUtcTm(tp, tm)) return {};
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string FormatDateUtc(Clock::time_point tp) {
    std::tm tm{};
    if (!ToUtcTm(tp, tm)) return {};
    char buf[16]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

std::string FormatCompactUtc(Clock::time_point tp) {
    std::tm tm{};
    if (!ToUtcTm(tp, tm)) return {};
    char head[24]{};
    std::strftime(head, sizeof(head), "%Y%m%dT%H%M%S", &tm);

    const auto since_sec = tp - Clock::from_time_t(Clock::to_time_t(tp));
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_sec).count();
    if (micros < 0) micros = 0;

    char buf[40]{};
    std::snprintf(buf, sizeof(buf), "%s.%06" PRId64 "Z", head, static_cast<std::int64_t>(micros));
    return buf;
}

bool ParseIso8601Utc(const std::string& s, Clock::time_point& out) {
    std::tm tm{};
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d", &y, &mo, &d, &h, &mi, &sec) != 6) {
        return false;
    }
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = sec;
    return FromUtcTm(tm, out);
}

bool ParseCompactUtc(const std::string& s, Clock::time_point& out) {
    std::tm tm{};
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    long micros = 0;
    if (std::sscanf(s.c_str(), "%4d%2d%2dT%2d%2d%2d.%6ldZ", &y, &mo, &d, &h, &mi, &sec, &micros) != 7) {
        return false;
    }
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = sec;
    if (!FromUtcTm(tm, out)) return false;
    out += std::chrono::microseconds(micros);
    return true;
}

} // namespace relup
