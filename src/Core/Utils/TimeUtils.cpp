/**
 * @file TimeUtils.cpp
 * @brief ISO-8601 timestamp helpers
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/TimeUtils.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace Warden {

std::string formatIso8601(WallTime time) {
    auto sinceEpoch = time.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch - seconds);

    std::time_t tt = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&tt, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(millis.count() < 0 ? 0 : millis.count()));
    return buffer;
}

Result<WallTime> parseIso8601(std::string_view text) {
    // Minimum: YYYY-MM-DDTHH:MM:SSZ
    if (text.size() < 20 || text.size() > 40) {
        return ErrorCode::InvalidTimestamp;
    }

    auto digits = [&](size_t pos, size_t count, int& out) -> bool {
        out = 0;
        for (size_t i = pos; i < pos + count; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
                return false;
            }
            out = out * 10 + (text[i] - '0');
        }
        return true;
    };

    int year, month, day, hour, minute, second;
    if (!digits(0, 4, year) || text[4] != '-' ||
        !digits(5, 2, month) || text[7] != '-' ||
        !digits(8, 2, day) || (text[10] != 'T' && text[10] != 't') ||
        !digits(11, 2, hour) || text[13] != ':' ||
        !digits(14, 2, minute) || text[16] != ':' ||
        !digits(17, 2, second)) {
        return ErrorCode::InvalidTimestamp;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return ErrorCode::InvalidTimestamp;
    }

    size_t pos = 19;
    int millis = 0;
    if (text[pos] == '.') {
        ++pos;
        int scale = 100;
        size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == start) {
            return ErrorCode::InvalidTimestamp;
        }
    }

    if (pos != text.size() - 1 || (text[pos] != 'Z' && text[pos] != 'z')) {
        return ErrorCode::InvalidTimestamp;
    }

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;

    std::time_t tt = timegm(&utc);
    if (tt == static_cast<std::time_t>(-1)) {
        return ErrorCode::InvalidTimestamp;
    }

    return WallClock::from_time_t(tt) + std::chrono::milliseconds(millis);
}

double daysBetween(WallTime earlier, WallTime later) noexcept {
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(later - earlier);
    return static_cast<double>(delta.count()) / (1000.0 * 60.0 * 60.0 * 24.0);
}

} // namespace Warden
