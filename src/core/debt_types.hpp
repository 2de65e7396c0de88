/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: debt_types.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The debt configuration handed to the engine by the portfolio layer, plus
 * its JSON form. The engine only ever reads a DebtConfiguration.
 * ============================================================================
 */

#ifndef DSYNC_DEBT_TYPES_HPP
#define DSYNC_DEBT_TYPES_HPP

#include "calendar.hpp"
#include "dsync_json.hpp"

#include <optional>
#include <string>

namespace dsync {

    enum class DebtKind {
        CreditCard,
        Loan,
        StudentLoan,
        AutoLoan,
        BuyNowPayLater,
    };

    // LOAN, STUDENT_LOAN and AUTO_LOAN follow an amortisation schedule.
    bool is_amortised_kind(DebtKind kind);

    std::string kind_to_string(DebtKind kind);
    std::optional<DebtKind> kind_from_string(const std::string& text);

    /**
     * @brief Parameters of one debt position.
     * Expected: apr >= 0, repayment_day_of_month in [1, 31], entered_at <= now.
     */
    struct DebtConfiguration {
        DebtKind kind = DebtKind::CreditCard;

        double current_balance = 0.0;   // balance when entered (or last edited)
        double apr = 0.0;               // percent, 19.9 means 19.9%
        double monthly_repayment = 0.0;
        int repayment_day_of_month = 1;
        Timestamp entered_at;

        // Loan term, when known
        std::optional<CivilDate> loan_start_date;
        std::optional<CivilDate> loan_end_date;
        std::optional<int> total_term_months;

        bool paid_off = false;
        bool archived = false;
    };

    bool has_loan_term(const DebtConfiguration& config);
    bool is_paid_off(const DebtConfiguration& config);
    bool is_archived(const DebtConfiguration& config);

    /**
     * @brief Monthly repayment implied by the loan term.
     * For an amortised kind with term data this is the amortised payment of
     * current_balance over total_term_months (or the months between the term
     * dates); otherwise the configured monthly_repayment.
     */
    double suggested_monthly_repayment(const DebtConfiguration& config);

    /**
     * @brief Decodes a portfolio debt document.
     * @throws ConfigError on missing or mistyped fields, an unparsable date,
     * a negative APR or a repayment day outside 1..31.
     */
    DebtConfiguration debt_from_json(const json& doc);

    json debt_to_json(const DebtConfiguration& config);

} // namespace dsync

#endif // DSYNC_DEBT_TYPES_HPP
