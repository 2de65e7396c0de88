/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: test_main.cpp
 * ============================================================================
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "core/logging.hpp"

int main(int argc, char* argv[]) {
    // Keep test output readable; log lines are still captured in the ring buffer.
    dsync::set_log_echo(false);
    return Catch::Session().run(argc, argv);
}
