/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: RepaymentLogStore.cpp
 * ============================================================================
 */

#include "RepaymentLogStore.hpp"
#include "../core/logging.hpp"

#include <utility>

namespace dsync {

RepaymentLogStore::RepaymentLogStore(KeyValueStore& backend, std::string key, NowFn now)
    : backend_(backend), key_(std::move(key)), now_(std::move(now)) {}

RepaymentLog RepaymentLogStore::load() {
    const Timestamp now = now_();

    std::optional<std::string> raw = backend_.get(key_);
    if (!raw || raw->empty()) {
        return make_empty_log(now);
    }

    std::optional<RepaymentLog> log = decode_log(*raw, now);
    if (!log) {
        return make_empty_log(now);
    }
    return *log;
}

void RepaymentLogStore::save(const RepaymentLog& log) {
    RepaymentLog to_save = log;
    to_save.updated_at = now_();
    backend_.set(key_, encode_log(to_save));
}

std::optional<RepaymentLogEntry> RepaymentLogStore::entry(const std::string& position_id) {
    RepaymentLog log = load();
    const RepaymentLogEntry* found = log.find(position_id);
    if (!found) {
        return std::nullopt;
    }
    return *found;
}

int RepaymentLogStore::applied_count(const std::string& position_id) {
    auto found = entry(position_id);
    return found ? found->applied_count : 0;
}

void RepaymentLogStore::remove(const std::string& position_id) {
    RepaymentLog log = load();
    if (log.erase(position_id)) {
        save(log);
    }
}

void RepaymentLogStore::prune(const std::set<std::string>& active_ids) {
    RepaymentLog log = load();
    std::size_t dropped = 0;

    for (auto it = log.entries.begin(); it != log.entries.end();) {
        if (active_ids.count(it->first) == 0) {
            it = log.entries.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }

    if (dropped > 0) {
        save(log);
        dsync_log("INFO", "Pruned " + std::to_string(dropped) + " orphaned repayment log entries.");
    }
}

void RepaymentLogStore::clear() {
    backend_.remove(key_);
    dsync_log("CRITICAL", "Repayment log '" + key_ + "' cleared.");
}

} // namespace dsync
