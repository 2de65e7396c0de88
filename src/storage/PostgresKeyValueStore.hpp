/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PostgresKeyValueStore.hpp
 * ============================================================================
 * * DESCRIPTION:
 * PostgreSQL backend (libpqxx). Each key is one row of a two-column table:
 *
 *   key TEXT PRIMARY KEY, value TEXT NOT NULL, updated_at TIMESTAMPTZ
 *
 * Every call opens its own connection and transaction, so an instance holds
 * no socket between calls and can be shared freely.
 * ============================================================================
 */

#ifndef DSYNC_POSTGRES_KV_STORE_HPP
#define DSYNC_POSTGRES_KV_STORE_HPP

#include "interface/kv_store.hpp"
#include "../core/config.hpp"

namespace dsync {

    class PostgresKeyValueStore : public KeyValueStore {
    public:
        PostgresKeyValueStore(std::string conn_str, std::string table = kDefaultKvTable);

        /**
         * @brief Creates the backing table when it does not exist yet.
         * @throws StoreError when the database is unreachable or refuses.
         */
        void ensure_schema();

        std::optional<std::string> get(const std::string& key) override;
        void set(const std::string& key, const std::string& value) override;
        void remove(const std::string& key) override;

    private:
        std::string conn_str_;
        std::string table_;
    };

    /**
     * @brief Builds a PostgresKeyValueStore from DSYNC_DB_CONN / DSYNC_KV_TABLE
     * and ensures its schema.
     * @throws ConfigError when no connection string is configured.
     */
    PostgresKeyValueStore make_postgres_store(const EngineConfig& config);

} // namespace dsync

#endif // DSYNC_POSTGRES_KV_STORE_HPP
