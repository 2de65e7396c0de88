/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: repayment_counter.cpp
 * ============================================================================
 */

#include "repayment_counter.hpp"

#include <algorithm>

namespace dsync {

int effective_repayment_day(int year, int zero_based_month, int repayment_day) {
    return std::min(repayment_day, days_in_month(year, zero_based_month));
}

int repayments_due(const CivilDate& entered, int repayment_day, const CivilDate& now) {
    int year = entered.year;
    int month = entered.month - 1;

    // Entered after this month's repayment day: first event is next month.
    if (entered.day > effective_repayment_day(year, month, repayment_day)) {
        if (++month > 11) {
            month = 0;
            ++year;
        }
    }

    const int now_month = now.month - 1;

    // Whole months strictly before now's month.
    int count = std::max(0, (now.year - year) * 12 + (now_month - month));

    // Now's own month, if the walk reaches it.
    if (year < now.year || (year == now.year && month <= now_month)) {
        if (now.day >= effective_repayment_day(now.year, now_month, repayment_day)) {
            ++count;
        }
    }

    return count;
}

int repayments_due(Timestamp entered_at, int repayment_day, Timestamp now) {
    return repayments_due(to_civil(entered_at), repayment_day, to_civil(now));
}

} // namespace dsync
