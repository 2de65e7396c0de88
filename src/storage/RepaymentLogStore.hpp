/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: RepaymentLogStore.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Sole owner of the persisted repayment log. Reads and writes the whole log
 * under one namespaced key of an injected KeyValueStore.
 * * FAILURE MODEL:
 * - Missing, unparsable or mis-shaped data loads as an empty log (as if the
 *   positions had never been synced) and leaves a diagnostic in the log.
 * - Backend I/O failures surface as StoreError, untouched.
 * * CONCURRENCY:
 * Read-modify-write without locking. Callers serialise sync passes.
 * ============================================================================
 */

#ifndef DSYNC_REPAYMENT_LOG_STORE_HPP
#define DSYNC_REPAYMENT_LOG_STORE_HPP

#include "interface/kv_store.hpp"
#include "repayment_log.hpp"
#include "../core/config.hpp"

#include <optional>
#include <set>
#include <string>

namespace dsync {

    class RepaymentLogStore {
    public:
        explicit RepaymentLogStore(KeyValueStore& backend, std::string key = kDefaultStorageKey,
                                   NowFn now = system_now);

        RepaymentLog load();

        // Persists the log with updated_at stamped to the current time.
        // Entry timestamps are left as the caller set them.
        void save(const RepaymentLog& log);

        // Read-only lookup; never triggers a sync.
        std::optional<RepaymentLogEntry> entry(const std::string& position_id);

        // 0 when the position has never been synced.
        int applied_count(const std::string& position_id);

        // Drops one position's entry (position deleted).
        void remove(const std::string& position_id);

        // Drops every entry whose position is not in `active_ids`.
        void prune(const std::set<std::string>& active_ids);

        // Deletes the whole log.
        void clear();

        const std::string& key() const { return key_; }

    private:
        KeyValueStore& backend_;
        std::string key_;
        NowFn now_;
    };

} // namespace dsync

#endif // DSYNC_REPAYMENT_LOG_STORE_HPP
