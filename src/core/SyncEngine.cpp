/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: SyncEngine.cpp
 * ============================================================================
 */

#include "SyncEngine.hpp"
#include "BalanceResolver.hpp"
#include "logging.hpp"
#include "repayment_counter.hpp"

#include <algorithm>

namespace dsync {

SyncEngine::SyncEngine(RepaymentLogStore& store, NowFn now)
    : store_(store), now_(std::move(now)) {}

bool SyncEngine::reconcile(RepaymentLog& log, const std::string& position_id,
                           const DebtConfiguration& config, Timestamp now,
                           SyncResult& result) const {
    const RepaymentLogEntry* existing = log.find(position_id);

    const int applied = existing ? existing->applied_count : 0;
    const int total_due = repayments_due(config.entered_at, config.repayment_day_of_month, now);
    const int new_repayments = std::max(0, total_due - applied);

    // Resume from the cache, not from the original principal.
    const double start_balance = existing ? existing->cached_balance : config.current_balance;
    AccrualOutcome accrual = accrue_repayments(start_balance, config.apr,
                                               config.monthly_repayment, new_repayments);

    RepaymentLogEntry updated;
    updated.position_id = position_id;
    updated.applied_count = applied + new_repayments;
    updated.cached_balance = accrual.balance;
    updated.cumulative_interest = (existing ? existing->cumulative_interest : 0.0) + accrual.interest;
    updated.cumulative_principal = (existing ? existing->cumulative_principal : 0.0) + accrual.principal;
    updated.last_synced_at = now;

    const bool changed = new_repayments > 0 || existing == nullptr;
    if (changed) {
        log.upsert(updated);
    }

    result.position_id = position_id;
    result.current_balance = updated.cached_balance;
    result.new_repayments_applied = new_repayments;
    result.total_repayments_applied = updated.applied_count;
    result.cumulative_interest = updated.cumulative_interest;
    result.cumulative_principal = updated.cumulative_principal;
    result.is_paid_off = updated.cached_balance <= kPayoffThreshold;
    return changed;
}

SyncResult SyncEngine::sync_one(const std::string& position_id, const DebtConfiguration& config,
                                Timestamp now) {
    RepaymentLog log = store_.load();

    SyncResult result;
    if (reconcile(log, position_id, config, now, result)) {
        store_.save(log);
    }
    return result;
}

SyncResult SyncEngine::sync_one(const std::string& position_id, const DebtConfiguration& config) {
    return sync_one(position_id, config, now_());
}

std::map<std::string, SyncResult> SyncEngine::sync_many(const std::vector<PositionRef>& positions,
                                                        Timestamp now) {
    std::map<std::string, SyncResult> results;
    if (positions.empty()) {
        return results;
    }

    RepaymentLog log = store_.load();
    bool has_changes = false;
    int applied_total = 0;

    for (const auto& position : positions) {
        const DebtConfiguration& config = position.second;

        // Archived and paid-off debts no longer accrue.
        if (is_archived(config) || is_paid_off(config)) continue;

        SyncResult result;
        if (reconcile(log, position.first, config, now, result)) {
            has_changes = true;
        }
        applied_total += result.new_repayments_applied;
        results[position.first] = result;
    }

    if (has_changes) {
        store_.save(log);
        dsync_log("INFO", "Debt sync applied " + std::to_string(applied_total) + " repayments across " +
                              std::to_string(results.size()) + " positions.");
    }

    return results;
}

std::map<std::string, SyncResult> SyncEngine::sync_many(const std::vector<PositionRef>& positions) {
    return sync_many(positions, now_());
}

void SyncEngine::reset_cached_balance(const std::string& position_id, double new_balance) {
    RepaymentLog log = store_.load();
    const RepaymentLogEntry* existing = log.find(position_id);

    if (!existing) {
        // Next sync seeds from the corrected configuration instead.
        return;
    }

    RepaymentLogEntry corrected = *existing;
    corrected.cached_balance = std::max(0.0, new_balance);
    corrected.last_synced_at = now_();
    log.upsert(corrected);

    store_.save(log);
}

} // namespace dsync
