/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Exception types raised by the engine. Arithmetic never throws; only the
 * persistence boundary (StoreError) and malformed external input
 * (ConfigError) fail an operation outright.
 * ============================================================================
 */

#ifndef DSYNC_ERRORS_HPP
#define DSYNC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace dsync {

    /**
     * @brief I/O failure in a KeyValueStore backend.
     * Propagated to the caller unmodified; the engine never retries.
     */
    class StoreError : public std::runtime_error {
    public:
        explicit StoreError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief Malformed configuration value or debt document.
     */
    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
    };

} // namespace dsync

#endif // DSYNC_ERRORS_HPP
