/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: repayment_log.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The persisted synchronisation state: one entry per debt position plus the
 * time of the last write. Stored as a single sealed JSON document:
 *
 *   {
 *     "entries": [ { "position_id", "applied_count", "cached_balance",
 *                    "cumulative_interest", "cumulative_principal",
 *                    "last_synced_at" } ],
 *     "updated_at": "2025-01-15T00:00:00.000Z",
 *     "checksum": "<sha256 of entries>"
 *   }
 * ============================================================================
 */

#ifndef DSYNC_REPAYMENT_LOG_HPP
#define DSYNC_REPAYMENT_LOG_HPP

#include "../core/calendar.hpp"

#include <map>
#include <optional>
#include <string>

namespace dsync {

    struct RepaymentLogEntry {
        std::string position_id;
        int applied_count = 0;
        double cached_balance = 0.0;
        double cumulative_interest = 0.0;
        double cumulative_principal = 0.0;
        Timestamp last_synced_at;
    };

    struct RepaymentLog {
        // Keyed by position id, which keeps entries unique.
        std::map<std::string, RepaymentLogEntry> entries;
        Timestamp updated_at;

        const RepaymentLogEntry* find(const std::string& position_id) const;
        void upsert(const RepaymentLogEntry& entry);
        // @return true if an entry was dropped.
        bool erase(const std::string& position_id);
    };

    RepaymentLog make_empty_log(Timestamp now);

    // Serialises and seals the log.
    std::string encode_log(const RepaymentLog& log);

    /**
     * @brief Parses and validates a stored document.
     * @return std::nullopt (with a diagnostic logged) when the text is not
     * JSON, the shape is wrong, or the seal does not match. An unsealed
     * document is accepted.
     * @param now Fills in timestamps that are missing or unreadable.
     */
    std::optional<RepaymentLog> decode_log(const std::string& raw, Timestamp now);

} // namespace dsync

#endif // DSYNC_REPAYMENT_LOG_HPP
