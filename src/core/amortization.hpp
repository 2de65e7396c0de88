/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: amortization.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Stateless debt arithmetic.
 *
 *   Amortised payment:  M = P * r(1+r)^n / ((1+r)^n - 1),  r = APR / 12 / 100
 *   Monthly update:     newBalance = balance * (1 + r) - repayment
 *
 * None of these functions throw. Out-of-range input (non-positive principal
 * or term, zero repayment) yields a defined neutral result; validation is the
 * caller's job.
 * ============================================================================
 */

#ifndef DSYNC_AMORTIZATION_HPP
#define DSYNC_AMORTIZATION_HPP

#include "config.hpp"

#include <optional>
#include <vector>

namespace dsync {

    /**
     * @brief Outcome of one month of interest accrual plus one repayment.
     * new_balance is never negative and is exactly 0 when is_paid_off.
     */
    struct MonthlyUpdateResult {
        double new_balance = 0.0;
        double interest_charged = 0.0;
        double principal_paid = 0.0;
        bool is_paid_off = false;
    };

    /**
     * @brief One month of a projected repayment schedule.
     */
    struct RepaymentStep {
        int month = 0;              // 1-based
        double balance = 0.0;       // end-of-month balance
        double interest = 0.0;
        double principal = 0.0;
        double cumulative_interest = 0.0;
        double cumulative_principal = 0.0;
    };

    // Monthly rate as a fraction, e.g. 12 (% APR) -> 0.01.
    inline double monthly_rate(double annual_rate_percent) {
        return annual_rate_percent / 12.0 / 100.0;
    }

    /**
     * @brief Fixed monthly payment that clears `principal` in `total_months`.
     * Interest-free (rate <= 0) loans divide evenly. Returns 0 for a
     * non-positive principal or term.
     */
    double amortized_payment(double principal, double annual_rate_percent, int total_months);

    /**
     * @brief Accrues one month of interest, then deducts the repayment.
     * A repayment covering balance plus interest clears the debt and books the
     * whole remaining balance as principal. A residue at or below
     * kPayoffThreshold is also treated as repaid.
     */
    MonthlyUpdateResult apply_monthly_update(double balance, double annual_rate_percent,
                                             double monthly_repayment);

    /**
     * @brief Lazily produced repayment schedule.
     *
     * Each call to next() advances one month until the debt is repaid or the
     * cap is hit, after which next() keeps returning std::nullopt. The
     * sequence cannot be rewound; construct a new projection to start over.
     * When the repayment never outpaces interest the projection simply runs
     * to the cap without reaching payoff.
     */
    class ScheduleProjection {
    public:
        ScheduleProjection(double balance, double annual_rate_percent, double monthly_repayment,
                           int max_months = kDefaultScheduleCap);

        std::optional<RepaymentStep> next();

        bool exhausted() const { return done_; }

        // True once a produced step has cleared the debt.
        bool reached_payoff() const { return paid_off_; }

    private:
        double balance_;
        double annual_rate_;
        double repayment_;
        int max_months_;
        int month_ = 0;
        double cumulative_interest_ = 0.0;
        double cumulative_principal_ = 0.0;
        bool done_ = false;
        bool paid_off_ = false;
    };

    /**
     * @brief Drains a ScheduleProjection into a vector.
     * Empty for a non-positive balance or repayment; never longer than max_months.
     */
    std::vector<RepaymentStep> project_schedule(double balance, double annual_rate_percent,
                                                double monthly_repayment,
                                                int max_months = kDefaultScheduleCap);

    /**
     * @brief Months until the projection reaches payoff, or std::nullopt when
     * the balance is already clear, the repayment is non-positive, or payoff
     * is not reached within max_months.
     */
    std::optional<int> months_to_payoff(double balance, double annual_rate_percent,
                                        double monthly_repayment,
                                        int max_months = kDefaultScheduleCap);

} // namespace dsync

#endif // DSYNC_AMORTIZATION_HPP
