/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Engine-wide constants and the environment-driven runtime configuration.
 * * ENVIRONMENT:
 * DSYNC_DB_CONN                 libpqxx connection string (optional)
 * DSYNC_STORAGE_KEY             key of the repayment log (default "debt-repayments")
 * DSYNC_KV_TABLE                PostgreSQL key-value table (default "dsync_kv_store")
 * DSYNC_MAX_PROJECTION_MONTHS   projection cap, 1..600 (default 600)
 * DSYNC_LOG_ECHO                "0" or "false" silences stdout echo
 * ============================================================================
 */

#ifndef DSYNC_CONFIG_HPP
#define DSYNC_CONFIG_HPP

#include <string>

namespace dsync {

    // A balance at or below this residue after a repayment counts as repaid.
    constexpr double kPayoffThreshold = 0.01;

    // Projection safety cap: 600 months is 50 years.
    constexpr int kDefaultScheduleCap = 600;

    constexpr const char* kDefaultStorageKey = "debt-repayments";
    constexpr const char* kDefaultKvTable = "dsync_kv_store";

    struct EngineConfig {
        std::string db_conn;
        std::string storage_key = kDefaultStorageKey;
        std::string kv_table = kDefaultKvTable;
        int max_projection_months = kDefaultScheduleCap;
        bool log_echo = true;

        bool has_database() const { return !db_conn.empty(); }
    };

    /**
     * @brief Builds an EngineConfig from DSYNC_* environment variables.
     * Unset variables keep their defaults. Also applies the log echo setting.
     * @throws ConfigError on a malformed or out-of-range value.
     */
    EngineConfig load_config_from_env();

} // namespace dsync

#endif // DSYNC_CONFIG_HPP
