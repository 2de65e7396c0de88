/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: amortization.cpp
 * ============================================================================
 */

#include "amortization.hpp"

#include <algorithm>
#include <cmath>

namespace dsync {

double amortized_payment(double principal, double annual_rate_percent, int total_months) {
    if (total_months <= 0) return 0.0;
    if (principal <= 0.0) return 0.0;

    // Interest-free: simple division
    if (annual_rate_percent <= 0.0) {
        return principal / total_months;
    }

    const double r = monthly_rate(annual_rate_percent);
    const double factor = std::pow(1.0 + r, total_months);

    // Very long terms overflow the factor; the payment tends to interest-only.
    if (!std::isfinite(factor)) {
        return principal * r;
    }
    return (principal * r * factor) / (factor - 1.0);
}

MonthlyUpdateResult apply_monthly_update(double balance, double annual_rate_percent,
                                         double monthly_repayment) {
    MonthlyUpdateResult result;

    if (balance <= 0.0) {
        result.is_paid_off = true;
        return result;
    }

    const double interest = balance * monthly_rate(annual_rate_percent);
    const double balance_with_interest = balance + interest;

    if (monthly_repayment >= balance_with_interest) {
        // Final payment
        result.interest_charged = interest;
        result.principal_paid = balance;
        result.is_paid_off = true;
        return result;
    }

    const double remaining = balance_with_interest - monthly_repayment;

    result.interest_charged = interest;
    result.principal_paid = std::max(0.0, monthly_repayment - interest);
    result.is_paid_off = remaining <= kPayoffThreshold;
    result.new_balance = result.is_paid_off ? 0.0 : remaining;
    return result;
}

ScheduleProjection::ScheduleProjection(double balance, double annual_rate_percent,
                                       double monthly_repayment, int max_months)
    : balance_(balance),
      annual_rate_(annual_rate_percent),
      repayment_(monthly_repayment),
      max_months_(std::min(max_months, kDefaultScheduleCap)) {
    if (balance_ <= 0.0 || repayment_ <= 0.0 || max_months_ <= 0) {
        done_ = true;
    }
}

std::optional<RepaymentStep> ScheduleProjection::next() {
    if (done_) return std::nullopt;

    MonthlyUpdateResult update = apply_monthly_update(balance_, annual_rate_, repayment_);
    ++month_;

    cumulative_interest_ += update.interest_charged;
    cumulative_principal_ += update.principal_paid;
    balance_ = update.new_balance;

    RepaymentStep step;
    step.month = month_;
    step.balance = update.new_balance;
    step.interest = update.interest_charged;
    step.principal = update.principal_paid;
    step.cumulative_interest = cumulative_interest_;
    step.cumulative_principal = cumulative_principal_;

    if (update.is_paid_off) {
        paid_off_ = true;
        done_ = true;
    } else if (month_ >= max_months_) {
        done_ = true;
    }
    return step;
}

std::vector<RepaymentStep> project_schedule(double balance, double annual_rate_percent,
                                            double monthly_repayment, int max_months) {
    std::vector<RepaymentStep> steps;
    ScheduleProjection projection(balance, annual_rate_percent, monthly_repayment, max_months);
    while (auto step = projection.next()) {
        steps.push_back(*step);
    }
    return steps;
}

std::optional<int> months_to_payoff(double balance, double annual_rate_percent,
                                    double monthly_repayment, int max_months) {
    if (balance <= kPayoffThreshold || monthly_repayment <= 0.0) return std::nullopt;

    ScheduleProjection projection(balance, annual_rate_percent, monthly_repayment, max_months);
    int months = 0;
    while (projection.next()) {
        ++months;
    }
    if (!projection.reached_payoff()) return std::nullopt;
    return months;
}

} // namespace dsync
