/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: test_amortization.cpp
 * ============================================================================
 */

#include <catch2/catch.hpp>
#include "core/amortization.hpp"

#include <cmath>
#include <limits>

using namespace dsync;

// ============================================================================
// Amortised payment
// ============================================================================

TEST_CASE("amortized_payment", "[amortization]") {
    SECTION("standard fixed-rate loan") {
        REQUIRE(amortized_payment(10000, 5.5, 60) == Approx(190.99).margin(0.01));
    }

    SECTION("interest-free loans divide evenly") {
        REQUIRE(amortized_payment(5000, 0, 24) == 5000.0 / 24);
        REQUIRE(amortized_payment(600, 0, 6) == 100.0);
        REQUIRE(amortized_payment(1000, -2, 10) == 100.0);
    }

    SECTION("large loan") {
        double payment = amortized_payment(300000, 4.5, 360);
        REQUIRE(payment == Approx(1520.06).margin(0.01));
    }

    SECTION("high APR") {
        double payment = amortized_payment(2000, 29.9, 12);
        REQUIRE(payment > 2000.0 / 12);
        REQUIRE(payment < 2000.0 / 12 * 1.25);
    }

    SECTION("very long terms converge to interest-only") {
        double payment = amortized_payment(10000, 5.5, 200000);
        REQUIRE(std::isfinite(payment));
        REQUIRE(payment == Approx(10000 * 5.5 / 12 / 100));

        double longest = amortized_payment(10000, 5.5, std::numeric_limits<int>::max());
        REQUIRE(longest == Approx(10000 * 5.5 / 12 / 100));
    }

    SECTION("neutral zero for non-positive inputs") {
        REQUIRE(amortized_payment(0, 5, 60) == 0.0);
        REQUIRE(amortized_payment(-100, 5, 60) == 0.0);
        REQUIRE(amortized_payment(10000, 5, 0) == 0.0);
        REQUIRE(amortized_payment(10000, 5, -12) == 0.0);
    }
}

// ============================================================================
// Single monthly update
// ============================================================================

TEST_CASE("apply_monthly_update", "[amortization]") {
    SECTION("interest accrues before the repayment") {
        MonthlyUpdateResult r = apply_monthly_update(5000, 19.9, 200);
        REQUIRE(r.interest_charged == Approx(82.92).margin(0.005));
        REQUIRE(r.principal_paid == Approx(117.08).margin(0.005));
        REQUIRE(r.new_balance == Approx(4882.92).margin(0.005));
        REQUIRE_FALSE(r.is_paid_off);
    }

    SECTION("interest-free") {
        MonthlyUpdateResult r = apply_monthly_update(1000, 0, 100);
        REQUIRE(r.interest_charged == 0.0);
        REQUIRE(r.principal_paid == 100.0);
        REQUIRE(r.new_balance == 900.0);
        REQUIRE_FALSE(r.is_paid_off);
    }

    SECTION("final payment clears the balance") {
        MonthlyUpdateResult r = apply_monthly_update(150, 0, 200);
        REQUIRE(r.new_balance == 0.0);
        REQUIRE(r.principal_paid == 150.0);
        REQUIRE(r.is_paid_off);
    }

    SECTION("final payment with interest books the whole balance as principal") {
        MonthlyUpdateResult r = apply_monthly_update(100, 12, 200);
        REQUIRE(r.interest_charged == Approx(1.0));
        REQUIRE(r.principal_paid == 100.0);
        REQUIRE(r.new_balance == 0.0);
        REQUIRE(r.is_paid_off);
    }

    SECTION("repayment exactly equal to balance plus interest") {
        MonthlyUpdateResult r = apply_monthly_update(100, 0, 100);
        REQUIRE(r.is_paid_off);
        REQUIRE(r.new_balance == 0.0);
    }

    SECTION("zero balance is already paid off") {
        MonthlyUpdateResult r = apply_monthly_update(0, 19.9, 200);
        REQUIRE(r.is_paid_off);
        REQUIRE(r.new_balance == 0.0);
        REQUIRE(r.interest_charged == 0.0);
        REQUIRE(r.principal_paid == 0.0);
    }

    SECTION("repayment below interest grows the debt without negative principal") {
        MonthlyUpdateResult r = apply_monthly_update(10000, 24, 100);
        REQUIRE(r.interest_charged == Approx(200.0));
        REQUIRE(r.principal_paid == 0.0);
        REQUIRE(r.new_balance == Approx(10100.0));
        REQUIRE_FALSE(r.is_paid_off);
    }

    SECTION("sub-cent residue counts as repaid") {
        MonthlyUpdateResult r = apply_monthly_update(100.005, 0, 100);
        REQUIRE(r.is_paid_off);
        REQUIRE(r.new_balance == 0.0);
    }

    SECTION("residue above the threshold stays outstanding") {
        MonthlyUpdateResult r = apply_monthly_update(100.02, 0, 100);
        REQUIRE_FALSE(r.is_paid_off);
        REQUIRE(r.new_balance == Approx(0.02));
    }
}

// ============================================================================
// Schedule projection
// ============================================================================

TEST_CASE("project_schedule", "[amortization]") {
    SECTION("interest-free schedule") {
        auto schedule = project_schedule(600, 0, 100);
        REQUIRE(schedule.size() == 6);
        REQUIRE(schedule[5].balance == 0.0);
        REQUIRE(schedule[5].cumulative_interest == 0.0);
        REQUIRE(schedule[5].cumulative_principal == Approx(600.0));
    }

    SECTION("with interest") {
        auto schedule = project_schedule(5000, 19.9, 200);
        REQUIRE(schedule.size() >= 30);
        REQUIRE(schedule.size() <= 35);

        const RepaymentStep& last = schedule.back();
        REQUIRE(last.balance == 0.0);
        REQUIRE(last.cumulative_interest > 1000.0);
        REQUIRE(last.cumulative_principal == Approx(5000.0).margin(0.05));
    }

    SECTION("empty for zero balance or zero repayment") {
        REQUIRE(project_schedule(0, 10, 100).empty());
        REQUIRE(project_schedule(1000, 10, 0).empty());
        REQUIRE(project_schedule(1000, 10, -5).empty());
    }

    SECTION("months are sequential from 1 and cumulative totals add up") {
        auto schedule = project_schedule(1200, 6, 250);
        double interest = 0.0;
        double principal = 0.0;
        for (std::size_t i = 0; i < schedule.size(); ++i) {
            REQUIRE(schedule[i].month == static_cast<int>(i) + 1);
            interest += schedule[i].interest;
            principal += schedule[i].principal;
            REQUIRE(schedule[i].cumulative_interest == Approx(interest));
            REQUIRE(schedule[i].cumulative_principal == Approx(principal));
            REQUIRE(schedule[i].balance >= 0.0);
        }
    }

    SECTION("respects the month cap") {
        auto schedule = project_schedule(100000, 0, 10, 24);
        REQUIRE(schedule.size() == 24);
        REQUIRE(schedule.back().balance > 0.0);
    }

    SECTION("a repayment that never covers interest runs to the cap") {
        auto schedule = project_schedule(10000, 24, 100);
        REQUIRE(schedule.size() == static_cast<std::size_t>(kDefaultScheduleCap));
        for (const auto& step : schedule) {
            REQUIRE(step.balance >= 0.0);
        }
        REQUIRE(schedule.back().balance > 10000.0);
    }

    SECTION("cap above the safety bound is clamped") {
        auto schedule = project_schedule(100000, 0, 1, 5000);
        REQUIRE(schedule.size() == static_cast<std::size_t>(kDefaultScheduleCap));
    }
}

TEST_CASE("ScheduleProjection is a one-shot sequence", "[amortization]") {
    ScheduleProjection projection(300, 0, 100);

    REQUIRE(projection.next()->month == 1);
    REQUIRE(projection.next()->month == 2);

    auto last = projection.next();
    REQUIRE(last.has_value());
    REQUIRE(last->balance == 0.0);
    REQUIRE(projection.exhausted());
    REQUIRE(projection.reached_payoff());

    REQUIRE_FALSE(projection.next().has_value());
    REQUIRE_FALSE(projection.next().has_value());
}

TEST_CASE("months_to_payoff", "[amortization]") {
    REQUIRE(months_to_payoff(2400, 0, 200) == 12);
    REQUIRE(months_to_payoff(600, 0, 100) == 6);

    SECTION("null when nothing is owed or nothing is repaid") {
        REQUIRE_FALSE(months_to_payoff(0, 5, 100).has_value());
        REQUIRE_FALSE(months_to_payoff(1000, 5, 0).has_value());
    }

    SECTION("null when payoff is out of reach") {
        REQUIRE_FALSE(months_to_payoff(10000, 24, 100).has_value());
    }
}

// ============================================================================
// End-to-end loan scenarios
// ============================================================================

TEST_CASE("amortised loans clear within their term", "[amortization][scenario]") {
    SECTION("student loan: 30,000 at 6.5% over 20 years") {
        double payment = amortized_payment(30000, 6.5, 240);
        REQUIRE(payment > 200.0);
        REQUIRE(payment < 250.0);

        auto schedule = project_schedule(30000, 6.5, payment);
        REQUIRE(schedule.size() <= 241);
        REQUIRE(schedule.back().balance == 0.0);
        REQUIRE(schedule.back().cumulative_interest > 20000.0);
    }

    SECTION("auto loan: 15,000 at 3.9% over 5 years") {
        double payment = amortized_payment(15000, 3.9, 60);
        REQUIRE(payment > 260.0);
        REQUIRE(payment < 290.0);

        auto schedule = project_schedule(15000, 3.9, payment);
        REQUIRE(schedule.size() <= 61);
        REQUIRE(schedule.back().balance == 0.0);
        REQUIRE(schedule.back().cumulative_interest > 1000.0);
        REQUIRE(schedule.back().cumulative_interest < 4000.0);
    }
}
