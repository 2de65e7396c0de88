/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: loan_progress.cpp
 * ============================================================================
 */

#include "loan_progress.hpp"

#include <algorithm>

namespace dsync {

LoanProgress loan_progress(const CivilDate& start, const CivilDate& end, const CivilDate& now) {
    LoanProgress progress;
    progress.total_months = months_between(start, end);
    progress.months_elapsed = months_between(start, now);
    progress.months_remaining = std::max(0, progress.total_months - progress.months_elapsed);

    if (progress.total_months > 0) {
        double percent = static_cast<double>(progress.months_elapsed) / progress.total_months * 100.0;
        progress.progress_percent = std::min(100.0, std::max(0.0, percent));
    }

    progress.is_term_complete = progress.months_elapsed >= progress.total_months;
    return progress;
}

LoanProgress loan_progress(const CivilDate& start, const CivilDate& end, Timestamp now) {
    return loan_progress(start, end, to_civil(now));
}

} // namespace dsync
