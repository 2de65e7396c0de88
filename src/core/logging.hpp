/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: logging.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Process-wide diagnostic log. Every line is kept in a bounded ring buffer
 * (so the owning application can surface recent activity) and echoed to
 * stdout unless echo has been switched off.
 * ============================================================================
 */

#ifndef DSYNC_LOGGING_HPP
#define DSYNC_LOGGING_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace dsync {

    // Maximum number of lines retained in the ring buffer.
    constexpr std::size_t kLogCapacity = 200;

    /**
     * @brief Records a diagnostic line as "[HH:MM:SS] [LEVEL] message".
     * @param level INFO, WARN, ERROR or CRITICAL
     */
    void dsync_log(const std::string& level, const std::string& message);

    // Snapshot of the retained lines, oldest first.
    std::vector<std::string> recent_logs();

    void clear_logs();

    void set_log_echo(bool enabled);

} // namespace dsync

#endif // DSYNC_LOGGING_HPP
