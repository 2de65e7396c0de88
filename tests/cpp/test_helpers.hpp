/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: test_helpers.hpp
 * ============================================================================
 */

#ifndef DSYNC_TEST_HELPERS_HPP
#define DSYNC_TEST_HELPERS_HPP

#include "core/calendar.hpp"

#include <chrono>

// Instant at `hour`:00 UTC on the given date.
inline dsync::Timestamp at(int year, int month, int day, int hour = 12) {
    return dsync::from_civil(dsync::CivilDate{year, month, day}) + std::chrono::hours(hour);
}

#endif // DSYNC_TEST_HELPERS_HPP
