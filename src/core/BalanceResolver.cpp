/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: BalanceResolver.cpp
 * ============================================================================
 */

#include "BalanceResolver.hpp"
#include "amortization.hpp"
#include "repayment_counter.hpp"

#include <algorithm>

namespace dsync {

AccrualOutcome accrue_repayments(double balance, double annual_rate_percent,
                                 double monthly_repayment, int count) {
    AccrualOutcome outcome;
    outcome.balance = balance;

    for (int i = 0; i < count; ++i) {
        MonthlyUpdateResult update = apply_monthly_update(outcome.balance, annual_rate_percent,
                                                          monthly_repayment);
        outcome.interest += update.interest_charged;
        outcome.principal += update.principal_paid;
        outcome.balance = update.new_balance;
        if (update.is_paid_off) {
            outcome.paid_off = true;
            break;
        }
    }

    outcome.balance = std::max(0.0, outcome.balance);
    return outcome;
}

DebtBalanceResult BalanceResolver::current_balance(const DebtConfiguration& config,
                                                   int applied_count, Timestamp now,
                                                   int max_months) {
    const int applied = std::max(0, applied_count);
    const int total_due = repayments_due(config.entered_at, config.repayment_day_of_month, now);
    const int new_repayments = std::max(0, total_due - applied);

    // Already-applied history, then whatever has come due since.
    AccrualOutcome history = accrue_repayments(config.current_balance, config.apr,
                                               config.monthly_repayment, applied);
    AccrualOutcome fresh = accrue_repayments(history.balance, config.apr,
                                             config.monthly_repayment,
                                             history.paid_off ? 0 : new_repayments);

    DebtBalanceResult result;
    result.current_balance = fresh.balance;
    result.total_interest_accrued = history.interest + fresh.interest;
    result.total_principal_repaid = history.principal + fresh.principal;
    result.repayments_applied = applied + new_repayments;
    result.is_paid_off = fresh.balance <= kPayoffThreshold;

    if (!result.is_paid_off) {
        result.months_to_payoff = months_to_payoff(fresh.balance, config.apr,
                                                   config.monthly_repayment, max_months);
    }

    if (has_loan_term(config)) {
        result.loan_progress = loan_progress(*config.loan_start_date, *config.loan_end_date, now);
    }

    return result;
}

DebtSummary BalanceResolver::summary(const DebtConfiguration& config, int applied_count,
                                     Timestamp now, int max_months) {
    DebtBalanceResult balance = current_balance(config, applied_count, now, max_months);

    DebtSummary summary;
    summary.balance = balance.current_balance;
    summary.monthly_repayment = config.monthly_repayment;
    summary.apr = config.apr;
    summary.total_repaid = balance.total_principal_repaid;
    summary.total_interest_accrued = balance.total_interest_accrued;
    summary.repayments_applied = balance.repayments_applied;
    summary.is_paid_off = balance.is_paid_off;
    summary.months_to_payoff = balance.months_to_payoff;
    summary.loan_progress = balance.loan_progress;

    const double original = config.current_balance;
    if (original > 0.0) {
        summary.paid_off_percent = std::min(100.0, balance.total_principal_repaid / original * 100.0);
    }

    if (balance.months_to_payoff) {
        summary.estimated_payoff_date = add_months(to_civil(now), *balance.months_to_payoff);
    }

    return summary;
}

DebtBalanceResult BalanceResolver::current_balance(const DebtConfiguration& config,
                                                   int applied_count, Timestamp now,
                                                   const EngineConfig& settings) {
    return current_balance(config, applied_count, now, settings.max_projection_months);
}

DebtSummary BalanceResolver::summary(const DebtConfiguration& config, int applied_count,
                                     Timestamp now, const EngineConfig& settings) {
    return summary(config, applied_count, now, settings.max_projection_months);
}

} // namespace dsync
