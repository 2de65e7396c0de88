/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: calendar.cpp
 * ============================================================================
 */

#include "calendar.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dsync {

namespace {

// Reads exactly `count` decimal digits starting at `pos`.
bool read_digits(const std::string& text, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

std::time_t timegm_portable(std::tm* utc_tm) {
#if defined(_WIN32)
    return _mkgmtime(utc_tm);
#else
    return timegm(utc_tm);
#endif
}

int floor_div(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int zero_based_month) {
    // Normalise so that month 12 is January of the following year.
    int y = year + floor_div(zero_based_month, 12);
    int m = zero_based_month - floor_div(zero_based_month, 12) * 12;

    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 1 && is_leap_year(y)) return 29;
    return kDays[m];
}

CivilDate to_civil(Timestamp ts) {
    auto secs = std::chrono::floor<std::chrono::seconds>(ts.time_since_epoch()).count();
    std::time_t raw = static_cast<std::time_t>(secs);
    std::tm utc_tm{};
    gmtime_r(&raw, &utc_tm);
    return CivilDate{utc_tm.tm_year + 1900, utc_tm.tm_mon + 1, utc_tm.tm_mday};
}

Timestamp from_civil(const CivilDate& date) {
    std::tm utc_tm{};
    utc_tm.tm_year = date.year - 1900;
    utc_tm.tm_mon = date.month - 1;
    utc_tm.tm_mday = date.day;
    return Clock::from_time_t(timegm_portable(&utc_tm));
}

int months_between(const CivilDate& from, const CivilDate& to) {
    int months = (to.year - from.year) * 12 + (to.month - from.month);
    return std::max(0, months);
}

int months_between(Timestamp from, Timestamp to) {
    return months_between(to_civil(from), to_civil(to));
}

CivilDate add_months(const CivilDate& date, int months) {
    int total = date.year * 12 + (date.month - 1) + months;
    int year = floor_div(total, 12);
    int month0 = total - year * 12;

    int dim = days_in_month(year, month0);
    if (date.day <= dim) {
        return CivilDate{year, month0 + 1, date.day};
    }

    int overflow = date.day - dim;
    ++month0;
    if (month0 > 11) {
        month0 = 0;
        ++year;
    }
    return CivilDate{year, month0 + 1, overflow};
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
    int year = 0, month = 0, day = 0;
    if (!read_digits(text, 0, 4, year) || text.size() < 10 || text[4] != '-' ||
        !read_digits(text, 5, 2, month) || text[7] != '-' || !read_digits(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month - 1)) return std::nullopt;

    int hour = 0, minute = 0, second = 0, millis = 0, offset_minutes = 0;
    std::size_t pos = 10;

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != ' ') return std::nullopt;
        if (!read_digits(text, pos + 1, 2, hour) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
            !read_digits(text, pos + 4, 2, minute)) {
            return std::nullopt;
        }
        pos += 6;
        if (pos < text.size() && text[pos] == ':') {
            if (!read_digits(text, pos + 1, 2, second)) return std::nullopt;
            pos += 3;
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            std::size_t digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (digits < 3) millis = millis * 10 + (text[pos] - '0');
                ++digits;
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (std::size_t i = digits; i < 3; ++i) millis *= 10;
        }
        if (pos < text.size()) {
            char zone = text[pos];
            if (zone == 'Z' || zone == 'z') {
                ++pos;
            } else if (zone == '+' || zone == '-') {
                int off_h = 0, off_m = 0;
                if (!read_digits(text, pos + 1, 2, off_h)) return std::nullopt;
                std::size_t mpos = pos + 3;
                if (mpos < text.size() && text[mpos] == ':') ++mpos;
                if (!read_digits(text, mpos, 2, off_m)) return std::nullopt;
                if (off_h > 23 || off_m > 59) return std::nullopt;
                offset_minutes = (off_h * 60 + off_m) * (zone == '-' ? -1 : 1);
                pos = mpos + 2;
            } else {
                return std::nullopt;
            }
        }
        if (pos != text.size()) return std::nullopt;
        if (hour > 23 || minute > 59 || second > 59) return std::nullopt;
    }

    Timestamp midnight = from_civil(CivilDate{year, month, day});
    return midnight + std::chrono::hours(hour) + std::chrono::minutes(minute - offset_minutes) +
           std::chrono::seconds(second) + std::chrono::milliseconds(millis);
}

std::string format_iso8601(Timestamp ts) {
    auto since_epoch = ts.time_since_epoch();
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs).count();

    std::time_t raw = static_cast<std::time_t>(secs.count());
    std::tm utc_tm{};
    gmtime_r(&raw, &utc_tm);

    std::stringstream ss;
    ss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << millis << 'Z';
    return ss.str();
}

std::string format_date(const CivilDate& date) {
    std::stringstream ss;
    ss << std::setw(4) << std::setfill('0') << date.year << '-' << std::setw(2) << date.month << '-'
       << std::setw(2) << date.day;
    return ss.str();
}

} // namespace dsync
