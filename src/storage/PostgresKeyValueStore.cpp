/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PostgresKeyValueStore.cpp
 * ============================================================================
 */

#include "PostgresKeyValueStore.hpp"
#include "../core/errors.hpp"
#include "../core/logging.hpp"

#include <pqxx/pqxx>
#include <utility>

namespace dsync {

namespace {

[[noreturn]] void raise_store_error(const std::string& operation, const std::exception& e) {
    dsync_log("ERROR", "PostgreSQL " + operation + " failed: " + e.what());
    throw StoreError("PostgreSQL " + operation + " failed: " + e.what());
}

} // namespace

PostgresKeyValueStore::PostgresKeyValueStore(std::string conn_str, std::string table)
    : conn_str_(std::move(conn_str)), table_(std::move(table)) {}

void PostgresKeyValueStore::ensure_schema() {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec("CREATE TABLE IF NOT EXISTS " + W.quote_name(table_) +
               " (key TEXT PRIMARY KEY, value TEXT NOT NULL, "
               "updated_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP)");
        W.commit();
    } catch (const std::exception& e) {
        raise_store_error("schema setup", e);
    }
}

std::optional<std::string> PostgresKeyValueStore::get(const std::string& key) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        pqxx::result R = W.exec("SELECT value FROM " + W.quote_name(table_) +
                                " WHERE key = " + W.quote(key));
        W.commit();

        if (R.empty()) {
            return std::nullopt;
        }
        return R[0][0].as<std::string>();
    } catch (const std::exception& e) {
        raise_store_error("read of '" + key + "'", e);
    }
}

void PostgresKeyValueStore::set(const std::string& key, const std::string& value) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec("INSERT INTO " + W.quote_name(table_) + " (key, value, updated_at) VALUES (" +
               W.quote(key) + ", " + W.quote(value) + ", CURRENT_TIMESTAMP) " +
               "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value, updated_at = EXCLUDED.updated_at");
        W.commit();
    } catch (const std::exception& e) {
        raise_store_error("write of '" + key + "'", e);
    }
}

void PostgresKeyValueStore::remove(const std::string& key) {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec("DELETE FROM " + W.quote_name(table_) + " WHERE key = " + W.quote(key));
        W.commit();
    } catch (const std::exception& e) {
        raise_store_error("delete of '" + key + "'", e);
    }
}

PostgresKeyValueStore make_postgres_store(const EngineConfig& config) {
    if (!config.has_database()) {
        dsync_log("ERROR", "Database connection variable missing. Cannot open PostgreSQL store.");
        throw ConfigError("DSYNC_DB_CONN is not set.");
    }

    PostgresKeyValueStore store(config.db_conn, config.kv_table);
    store.ensure_schema();
    dsync_log("INFO", "PostgreSQL key-value store ready (table " + config.kv_table + ").");
    return store;
}

} // namespace dsync
