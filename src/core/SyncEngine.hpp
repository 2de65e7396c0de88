/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: SyncEngine.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Idempotent catch-up of scheduled repayments against the persisted log.
 *
 * Per position the log moves Unsynced -> Synced(count, balance) ->
 * Synced(count', balance') with count' >= count. A sync resumes from the
 * cached balance and applies only the repayments that became due since the
 * last one; the number due is always recomputed from the immutable entry
 * date, so a lost update corrects itself on the next pass.
 *
 * Writes happen only when something changed: a second sync on the same day
 * computes a zero delta and leaves storage untouched.
 * ============================================================================
 */

#ifndef DSYNC_SYNC_ENGINE_HPP
#define DSYNC_SYNC_ENGINE_HPP

#include "debt_types.hpp"
#include "../storage/RepaymentLogStore.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dsync {

    struct SyncResult {
        std::string position_id;
        double current_balance = 0.0;
        int new_repayments_applied = 0;
        int total_repayments_applied = 0;
        double cumulative_interest = 0.0;
        double cumulative_principal = 0.0;
        bool is_paid_off = false;
    };

    using PositionRef = std::pair<std::string, DebtConfiguration>;

    class SyncEngine {
    public:
        explicit SyncEngine(RepaymentLogStore& store, NowFn now = system_now);

        /**
         * @brief Brings one position up to date.
         * A position with no entry starts from config.current_balance with
         * nothing applied; its first sync always writes.
         * @throws StoreError on backend failure.
         */
        SyncResult sync_one(const std::string& position_id, const DebtConfiguration& config,
                            Timestamp now);
        SyncResult sync_one(const std::string& position_id, const DebtConfiguration& config);

        /**
         * @brief sync_one() for a whole portfolio with one load and at most one
         * save. Archived and paid-off positions are skipped and have no entry
         * in the result.
         */
        std::map<std::string, SyncResult> sync_many(const std::vector<PositionRef>& positions,
                                                    Timestamp now);
        std::map<std::string, SyncResult> sync_many(const std::vector<PositionRef>& positions);

        /**
         * @brief Manual balance correction.
         * Replaces the cached balance (floored at 0) and stamps last_synced_at,
         * keeping applied_count and the cumulative totals so elapsed
         * repayments are not applied again. No-op for an unsynced position.
         */
        void reset_cached_balance(const std::string& position_id, double new_balance);

    private:
        // Updates `log` in memory. @return true if the entry must be persisted.
        bool reconcile(RepaymentLog& log, const std::string& position_id,
                       const DebtConfiguration& config, Timestamp now, SyncResult& result) const;

        RepaymentLogStore& store_;
        NowFn now_;
    };

} // namespace dsync

#endif // DSYNC_SYNC_ENGINE_HPP
