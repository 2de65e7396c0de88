/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.cpp
 * ============================================================================
 */

#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <cstdlib>

namespace dsync {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

int parse_month_cap(const std::string& raw) {
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(raw, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }

    if (consumed == 0 || consumed != raw.size()) {
        dsync_log("ERROR", "DSYNC_MAX_PROJECTION_MONTHS is not an integer: " + raw);
        throw ConfigError("DSYNC_MAX_PROJECTION_MONTHS must be an integer, got '" + raw + "'");
    }
    if (value < 1 || value > kDefaultScheduleCap) {
        dsync_log("ERROR", "DSYNC_MAX_PROJECTION_MONTHS out of range: " + raw);
        throw ConfigError("DSYNC_MAX_PROJECTION_MONTHS must be within 1.." +
                          std::to_string(kDefaultScheduleCap));
    }
    return value;
}

} // namespace

EngineConfig load_config_from_env() {
    EngineConfig config;

    config.db_conn = env_or("DSYNC_DB_CONN", "");
    config.storage_key = env_or("DSYNC_STORAGE_KEY", kDefaultStorageKey);
    config.kv_table = env_or("DSYNC_KV_TABLE", kDefaultKvTable);

    const char* env_cap = std::getenv("DSYNC_MAX_PROJECTION_MONTHS");
    if (env_cap && *env_cap) {
        config.max_projection_months = parse_month_cap(env_cap);
    }

    std::string echo = env_or("DSYNC_LOG_ECHO", "1");
    config.log_echo = !(echo == "0" || echo == "false" || echo == "FALSE");
    set_log_echo(config.log_echo);

    return config;
}

} // namespace dsync
