/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: calendar.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Calendar arithmetic used by repayment scheduling. Every decomposition of a
 * Timestamp into year/month/day happens in UTC, so a given instant always
 * lands on the same civil date regardless of the host time zone.
 * ============================================================================
 */

#ifndef DSYNC_CALENDAR_HPP
#define DSYNC_CALENDAR_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace dsync {

    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;

    // Source of "now"; injectable so tests can pin the date.
    using NowFn = std::function<Timestamp()>;

    inline Timestamp system_now() { return Clock::now(); }

    /**
     * @brief A proleptic Gregorian date. Month is 1-based (1 = January).
     */
    struct CivilDate {
        int year = 1970;
        int month = 1;
        int day = 1;

        bool operator==(const CivilDate& other) const {
            return year == other.year && month == other.month && day == other.day;
        }
        bool operator!=(const CivilDate& other) const { return !(*this == other); }
    };

    bool is_leap_year(int year);

    /**
     * @brief Calendar days in a month, leap years included.
     * @param zero_based_month 0 = January, 11 = December
     */
    int days_in_month(int year, int zero_based_month);

    CivilDate to_civil(Timestamp ts);

    // Midnight UTC at the start of the given date.
    Timestamp from_civil(const CivilDate& date);

    /**
     * @brief Whole calendar months from `from` to `to`, ignoring the day.
     * (toYear - fromYear) * 12 + (toMonth - fromMonth), never negative.
     */
    int months_between(const CivilDate& from, const CivilDate& to);
    int months_between(Timestamp from, Timestamp to);

    /**
     * @brief Moves a date by `months`. A day past the end of the target
     * month rolls over into the next one (Jan 31 + 1 month = Mar 3 in 2025).
     */
    CivilDate add_months(const CivilDate& date, int months);

    /**
     * @brief Parses "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]".
     * A date-time without an offset is read as UTC.
     * @return std::nullopt for malformed text or out-of-range fields.
     */
    std::optional<Timestamp> parse_iso8601(const std::string& text);

    // "YYYY-MM-DDTHH:MM:SS.mmmZ"
    std::string format_iso8601(Timestamp ts);

    // "YYYY-MM-DD"
    std::string format_date(const CivilDate& date);

} // namespace dsync

#endif // DSYNC_CALENDAR_HPP
