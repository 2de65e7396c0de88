/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: test_calendar.cpp
 * ============================================================================
 */

#include <catch2/catch.hpp>
#include "core/calendar.hpp"
#include "test_helpers.hpp"

using namespace dsync;

// ============================================================================
// Month lengths
// ============================================================================

TEST_CASE("days_in_month", "[calendar]") {
    REQUIRE(days_in_month(2025, 0) == 31);
    REQUIRE(days_in_month(2025, 1) == 28);
    REQUIRE(days_in_month(2024, 1) == 29);
    REQUIRE(days_in_month(2025, 3) == 30);
    REQUIRE(days_in_month(2025, 5) == 30);
    REQUIRE(days_in_month(2025, 11) == 31);

    SECTION("century rules") {
        REQUIRE(days_in_month(1900, 1) == 28);
        REQUIRE(days_in_month(2000, 1) == 29);
    }

    SECTION("month 12 wraps into January of the next year") {
        REQUIRE(days_in_month(2024, 12) == 31);
        REQUIRE(days_in_month(2023, 13) == 29);
    }
}

// ============================================================================
// Month spans
// ============================================================================

TEST_CASE("months_between", "[calendar]") {
    SECTION("same year") {
        REQUIRE(months_between(CivilDate{2025, 1, 15}, CivilDate{2025, 6, 15}) == 5);
    }

    SECTION("across a year boundary") {
        REQUIRE(months_between(CivilDate{2024, 11, 1}, CivilDate{2025, 2, 1}) == 3);
    }

    SECTION("same month ignores the day") {
        REQUIRE(months_between(CivilDate{2025, 3, 1}, CivilDate{2025, 3, 31}) == 0);
        REQUIRE(months_between(CivilDate{2025, 3, 31}, CivilDate{2025, 4, 1}) == 1);
    }

    SECTION("never negative") {
        REQUIRE(months_between(CivilDate{2025, 6, 1}, CivilDate{2025, 1, 1}) == 0);
    }

    SECTION("multi-year span") {
        REQUIRE(months_between(CivilDate{2020, 1, 1}, CivilDate{2025, 1, 1}) == 60);
        REQUIRE(months_between(at(2024, 1, 1), at(2025, 1, 1)) == 12);
    }
}

TEST_CASE("add_months", "[calendar]") {
    REQUIRE(add_months(CivilDate{2025, 1, 15}, 1) == CivilDate{2025, 2, 15});
    REQUIRE(add_months(CivilDate{2025, 11, 10}, 3) == CivilDate{2026, 2, 10});
    REQUIRE(add_months(CivilDate{2025, 3, 10}, -3) == CivilDate{2024, 12, 10});
    REQUIRE(add_months(CivilDate{2025, 1, 1}, 0) == CivilDate{2025, 1, 1});

    SECTION("overflowing day rolls into the following month") {
        REQUIRE(add_months(CivilDate{2025, 1, 31}, 1) == CivilDate{2025, 3, 3});
        REQUIRE(add_months(CivilDate{2024, 1, 31}, 1) == CivilDate{2024, 3, 2});
        REQUIRE(add_months(CivilDate{2025, 10, 31}, 1) == CivilDate{2025, 12, 1});
    }
}

// ============================================================================
// ISO 8601
// ============================================================================

TEST_CASE("parse_iso8601", "[calendar]") {
    SECTION("date only is midnight UTC") {
        auto ts = parse_iso8601("2022-01-15");
        REQUIRE(ts.has_value());
        REQUIRE(to_civil(*ts) == CivilDate{2022, 1, 15});
        REQUIRE(format_iso8601(*ts) == "2022-01-15T00:00:00.000Z");
    }

    SECTION("date-time with Z and milliseconds") {
        auto ts = parse_iso8601("2025-03-15T10:30:45.123Z");
        REQUIRE(ts.has_value());
        REQUIRE(format_iso8601(*ts) == "2025-03-15T10:30:45.123Z");
    }

    SECTION("offsets are normalised to UTC") {
        auto ts = parse_iso8601("2025-01-01T01:00:00+02:00");
        REQUIRE(ts.has_value());
        REQUIRE(format_iso8601(*ts) == "2024-12-31T23:00:00.000Z");

        auto west = parse_iso8601("2025-01-31T22:00:00-0300");
        REQUIRE(west.has_value());
        REQUIRE(to_civil(*west) == CivilDate{2025, 2, 1});
    }

    SECTION("missing offset reads as UTC") {
        auto ts = parse_iso8601("2025-06-01T08:15");
        REQUIRE(ts.has_value());
        REQUIRE(format_iso8601(*ts) == "2025-06-01T08:15:00.000Z");
    }

    SECTION("rejects malformed text") {
        REQUIRE_FALSE(parse_iso8601("").has_value());
        REQUIRE_FALSE(parse_iso8601("not a date").has_value());
        REQUIRE_FALSE(parse_iso8601("2025-13-01").has_value());
        REQUIRE_FALSE(parse_iso8601("2025-02-29").has_value());
        REQUIRE_FALSE(parse_iso8601("2025-01-15T25:00:00Z").has_value());
        REQUIRE_FALSE(parse_iso8601("2025-01-15Tgarbage").has_value());
        REQUIRE_FALSE(parse_iso8601("2025-01-15T10:00:00Zextra").has_value());
    }

    SECTION("leap day accepted in leap years") {
        REQUIRE(parse_iso8601("2024-02-29").has_value());
    }
}

TEST_CASE("format_date", "[calendar]") {
    REQUIRE(format_date(CivilDate{2025, 3, 7}) == "2025-03-07");
    REQUIRE(format_date(CivilDate{2027, 12, 31}) == "2027-12-31");
}
