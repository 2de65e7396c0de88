/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: repayment_counter.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Counts the scheduled monthly repayments that have fallen due since a debt
 * was entered. A repayment day beyond the end of a short month is clamped to
 * that month's last day (day 31 falls on Feb 28/29, Apr 30, ...).
 * ============================================================================
 */

#ifndef DSYNC_REPAYMENT_COUNTER_HPP
#define DSYNC_REPAYMENT_COUNTER_HPP

#include "calendar.hpp"

namespace dsync {

    // Repayment day clamped to the length of the given month.
    int effective_repayment_day(int year, int zero_based_month, int repayment_day);

    /**
     * @brief Number of repayment events elapsed between entry and `now`.
     *
     * The entry month holds the first event when the entry day is on or
     * before that month's (clamped) repayment day, so entering a debt on its
     * repayment day makes one repayment due that same day. Otherwise the
     * first event is in the following month. Months wholly before `now`'s
     * month count in full; `now`'s own month counts once its day reaches the
     * clamped repayment day.
     *
     * Pure: identical arguments always give the identical count.
     */
    int repayments_due(const CivilDate& entered, int repayment_day, const CivilDate& now);
    int repayments_due(Timestamp entered_at, int repayment_day, Timestamp now);

} // namespace dsync

#endif // DSYNC_REPAYMENT_COUNTER_HPP
