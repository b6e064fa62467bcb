// ==============================================================================
// datetime.cpp - Время и RFC 3339
// ==============================================================================

#include "warden/datetime.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace warden::datetime {

namespace {

// Число дней от 1970-01-01 до заданной гражданской даты (proleptic Gregorian)
std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) {
        return 29;
    }
    return days[m - 1];
}

bool parse_int(std::string_view s, int& out) {
    if (s.empty()) {
        return false;
    }
    out = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
        out = out * 10 + (c - '0');
    }
    return true;
}

std::tm to_tm_utc(TimePoint tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif
    return tm_utc;
}

}  // namespace

TimePoint now() {
    return std::chrono::system_clock::now();
}

Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

// ----------------------------------------------------------------------------
// parse_rfc3339
// ----------------------------------------------------------------------------

std::optional<TimePoint> parse_rfc3339(std::string_view str) {
    // Минимальная длина: YYYY-MM-DDTHH:MM:SS = 19 символов
    if (str.size() < 19) {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!parse_int(str.substr(0, 4), year) || str[4] != '-') {
        return std::nullopt;
    }
    if (!parse_int(str.substr(5, 2), month) || month < 1 || month > 12 || str[7] != '-') {
        return std::nullopt;
    }
    if (!parse_int(str.substr(8, 2), day) || day < 1 || day > days_in_month(year, month)) {
        return std::nullopt;
    }
    if (str[10] != 'T' && str[10] != 't' && str[10] != ' ') {
        return std::nullopt;
    }
    if (!parse_int(str.substr(11, 2), hour) || hour > 23 || str[13] != ':') {
        return std::nullopt;
    }
    if (!parse_int(str.substr(14, 2), minute) || minute > 59 || str[16] != ':') {
        return std::nullopt;
    }
    // 60 допускается для секунды координации
    if (!parse_int(str.substr(17, 2), second) || second > 60) {
        return std::nullopt;
    }

    // Дробная часть секунд (нормализуется к наносекундам)
    std::size_t pos = 19;
    std::int64_t nanos = 0;
    if (pos < str.size() && str[pos] == '.') {
        ++pos;
        std::size_t frac_start = pos;
        int digits = 0;
        while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (str[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == frac_start) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    // Смещение часового пояса
    int offset_minutes = 0;
    if (pos < str.size()) {
        char c = str[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            if (str.size() < pos + 6 || str[pos + 3] != ':') {
                return std::nullopt;
            }
            int oh = 0, om = 0;
            if (!parse_int(str.substr(pos + 1, 2), oh) || !parse_int(str.substr(pos + 4, 2), om) ||
                oh > 23 || om > 59) {
                return std::nullopt;
            }
            offset_minutes = oh * 60 + om;
            if (c == '-') {
                offset_minutes = -offset_minutes;
            }
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != str.size()) {
        return std::nullopt;
    }

    std::int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                        static_cast<unsigned>(day));
    std::int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second -
                        static_cast<std::int64_t>(offset_minutes) * 60;

    auto since_epoch = std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
}

// ----------------------------------------------------------------------------
// format_rfc3339
// ----------------------------------------------------------------------------

std::string format_rfc3339(TimePoint tp) {
    std::int64_t ms = unix_millis(tp);
    std::int64_t ms_part = ms % 1000;
    if (ms_part < 0) {
        ms_part += 1000;
    }
    TimePoint whole = from_unix_millis(ms - ms_part);
    std::tm tm_utc = to_tm_utc(whole);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms_part << 'Z';
    return oss.str();
}

std::int64_t unix_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_unix_millis(std::int64_t millis) {
    return TimePoint(
        std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

int weekday_utc(TimePoint tp) {
    return to_tm_utc(tp).tm_wday;
}

int hour_utc(TimePoint tp) {
    return to_tm_utc(tp).tm_hour;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    auto d = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(d).count();
}

}  // namespace warden::datetime
