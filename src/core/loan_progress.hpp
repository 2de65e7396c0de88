/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: loan_progress.hpp
 * ============================================================================
 */

#ifndef DSYNC_LOAN_PROGRESS_HPP
#define DSYNC_LOAN_PROGRESS_HPP

#include "calendar.hpp"

namespace dsync {

    /**
     * @brief Position within a fixed loan term.
     */
    struct LoanProgress {
        int total_months = 0;
        int months_elapsed = 0;
        int months_remaining = 0;
        double progress_percent = 0.0;  // 0..100
        bool is_term_complete = false;
    };

    /**
     * @brief Progress through the term [start, end] as of `now`, in whole
     * calendar months. A zero-length term reports 0% and is complete.
     */
    LoanProgress loan_progress(const CivilDate& start, const CivilDate& end, const CivilDate& now);
    LoanProgress loan_progress(const CivilDate& start, const CivilDate& end, Timestamp now);

} // namespace dsync

#endif // DSYNC_LOAN_PROGRESS_HPP
