/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: BalanceResolver.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Answers "what is this debt's balance right now" without touching storage.
 * The whole trajectory is replayed from the configured principal: first the
 * repayments the caller says are already applied, then any that have fallen
 * due since. SyncEngine is the cached counterpart that resumes from a stored
 * balance instead.
 * ============================================================================
 */

#ifndef DSYNC_BALANCE_RESOLVER_HPP
#define DSYNC_BALANCE_RESOLVER_HPP

#include "debt_types.hpp"
#include "loan_progress.hpp"
#include "config.hpp"

#include <optional>

namespace dsync {

    /**
     * @brief Running totals of a batch of monthly updates.
     */
    struct AccrualOutcome {
        double balance = 0.0;
        double interest = 0.0;
        double principal = 0.0;
        bool paid_off = false;
    };

    /**
     * @brief Applies up to `count` monthly updates starting from `balance`,
     * stopping at the update that clears the debt.
     */
    AccrualOutcome accrue_repayments(double balance, double annual_rate_percent,
                                     double monthly_repayment, int count);

    struct DebtBalanceResult {
        double current_balance = 0.0;
        double total_interest_accrued = 0.0;
        double total_principal_repaid = 0.0;
        int repayments_applied = 0;
        bool is_paid_off = false;
        std::optional<int> months_to_payoff;
        std::optional<LoanProgress> loan_progress;
    };

    struct DebtSummary {
        double balance = 0.0;
        double monthly_repayment = 0.0;
        double apr = 0.0;
        double paid_off_percent = 0.0;      // 0..100 of the configured principal
        double total_repaid = 0.0;          // principal only
        double total_interest_accrued = 0.0;
        int repayments_applied = 0;
        bool is_paid_off = false;
        std::optional<int> months_to_payoff;
        std::optional<CivilDate> estimated_payoff_date;
        std::optional<LoanProgress> loan_progress;
    };

    class BalanceResolver {
    public:
        /**
         * @brief Replays `applied_count` repayments from config.current_balance,
         * then applies the ones newly due by `now`.
         * @param max_months Cap on the months-to-payoff projection.
         */
        static DebtBalanceResult current_balance(const DebtConfiguration& config, int applied_count,
                                                 Timestamp now,
                                                 int max_months = kDefaultScheduleCap);

        /**
         * @brief Display view built on current_balance(). The estimated payoff
         * date is `now` moved forward by months_to_payoff.
         */
        static DebtSummary summary(const DebtConfiguration& config, int applied_count,
                                   Timestamp now, int max_months = kDefaultScheduleCap);

        // Same, projecting no further than settings.max_projection_months.
        static DebtBalanceResult current_balance(const DebtConfiguration& config, int applied_count,
                                                 Timestamp now, const EngineConfig& settings);
        static DebtSummary summary(const DebtConfiguration& config, int applied_count,
                                   Timestamp now, const EngineConfig& settings);
    };

} // namespace dsync

#endif // DSYNC_BALANCE_RESOLVER_HPP
