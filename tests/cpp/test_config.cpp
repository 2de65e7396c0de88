/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: test_config.cpp
 * ============================================================================
 */

#include <catch2/catch.hpp>
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <cstdlib>

using namespace dsync;

namespace {

const char* const kEngineVars[] = {
    "DSYNC_DB_CONN",
    "DSYNC_STORAGE_KEY",
    "DSYNC_KV_TABLE",
    "DSYNC_MAX_PROJECTION_MONTHS",
    "DSYNC_LOG_ECHO",
};

// Clears the engine's variables on entry and exit; restores quiet logging.
struct EnvGuard {
    EnvGuard() { reset(); }
    ~EnvGuard() {
        reset();
        set_log_echo(false);
    }
    static void reset() {
        for (const char* name : kEngineVars) unsetenv(name);
    }
};

} // namespace

// ============================================================================
// load_config_from_env
// ============================================================================

TEST_CASE("load_config_from_env defaults", "[config]") {
    EnvGuard guard;

    EngineConfig config = load_config_from_env();
    REQUIRE(config.db_conn.empty());
    REQUIRE_FALSE(config.has_database());
    REQUIRE(config.storage_key == "debt-repayments");
    REQUIRE(config.kv_table == "dsync_kv_store");
    REQUIRE(config.max_projection_months == 600);
    REQUIRE(config.log_echo);
}

TEST_CASE("load_config_from_env overrides", "[config]") {
    EnvGuard guard;

    setenv("DSYNC_DB_CONN", "host=localhost dbname=dsync", 1);
    setenv("DSYNC_STORAGE_KEY", "household-debts", 1);
    setenv("DSYNC_KV_TABLE", "kv_debts", 1);
    setenv("DSYNC_MAX_PROJECTION_MONTHS", "360", 1);
    setenv("DSYNC_LOG_ECHO", "0", 1);

    EngineConfig config = load_config_from_env();
    REQUIRE(config.has_database());
    REQUIRE(config.db_conn == "host=localhost dbname=dsync");
    REQUIRE(config.storage_key == "household-debts");
    REQUIRE(config.kv_table == "kv_debts");
    REQUIRE(config.max_projection_months == 360);
    REQUIRE_FALSE(config.log_echo);
}

TEST_CASE("load_config_from_env treats empty values as unset", "[config]") {
    EnvGuard guard;

    setenv("DSYNC_STORAGE_KEY", "", 1);
    setenv("DSYNC_MAX_PROJECTION_MONTHS", "", 1);

    EngineConfig config = load_config_from_env();
    REQUIRE(config.storage_key == kDefaultStorageKey);
    REQUIRE(config.max_projection_months == kDefaultScheduleCap);
}

TEST_CASE("load_config_from_env rejects a bad projection cap", "[config]") {
    EnvGuard guard;

    SECTION("not a number") {
        setenv("DSYNC_MAX_PROJECTION_MONTHS", "ten", 1);
        REQUIRE_THROWS_AS(load_config_from_env(), ConfigError);
    }

    SECTION("trailing garbage") {
        setenv("DSYNC_MAX_PROJECTION_MONTHS", "12months", 1);
        REQUIRE_THROWS_AS(load_config_from_env(), ConfigError);
    }

    SECTION("zero") {
        setenv("DSYNC_MAX_PROJECTION_MONTHS", "0", 1);
        REQUIRE_THROWS_AS(load_config_from_env(), ConfigError);
    }

    SECTION("above the hard cap") {
        setenv("DSYNC_MAX_PROJECTION_MONTHS", "601", 1);
        REQUIRE_THROWS_AS(load_config_from_env(), ConfigError);
    }

    SECTION("boundaries are accepted") {
        setenv("DSYNC_MAX_PROJECTION_MONTHS", "1", 1);
        REQUIRE(load_config_from_env().max_projection_months == 1);
        setenv("DSYNC_MAX_PROJECTION_MONTHS", "600", 1);
        REQUIRE(load_config_from_env().max_projection_months == 600);
    }
}

TEST_CASE("load_config_from_env echo switch", "[config]") {
    EnvGuard guard;

    setenv("DSYNC_LOG_ECHO", "false", 1);
    REQUIRE_FALSE(load_config_from_env().log_echo);

    setenv("DSYNC_LOG_ECHO", "FALSE", 1);
    REQUIRE_FALSE(load_config_from_env().log_echo);

    setenv("DSYNC_LOG_ECHO", "yes", 1);
    REQUIRE(load_config_from_env().log_echo);
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE("dsync_log ring buffer", "[logging]") {
    clear_logs();

    SECTION("formats level and message") {
        dsync_log("WARN", "balance drifted");
        auto lines = recent_logs();
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].size() > 11);
        REQUIRE(lines[0][0] == '[');
        REQUIRE(lines[0].substr(10) == " [WARN] balance drifted");
    }

    SECTION("keeps only the most recent lines") {
        for (std::size_t i = 0; i < kLogCapacity + 25; ++i) {
            dsync_log("INFO", "line " + std::to_string(i));
        }
        auto lines = recent_logs();
        REQUIRE(lines.size() == kLogCapacity);
        REQUIRE(lines.front().find("line 25") != std::string::npos);
        REQUIRE(lines.back().find("line 224") != std::string::npos);
    }

    clear_logs();
}
