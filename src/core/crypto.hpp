/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: crypto.hpp
 * ============================================================================
 * * DESCRIPTION:
 * SHA-256 sealing of the persisted repayment log, so a truncated or
 * hand-edited document is detected on load.
 * ============================================================================
 */

#ifndef DSYNC_CRYPTO_HPP
#define DSYNC_CRYPTO_HPP

#include "dsync_json.hpp"

#include <string>

namespace dsync {

class DsyncCrypto {
public:
    // Lowercase hex digest. Throws std::runtime_error if OpenSSL fails.
    static std::string generate_sha256(const std::string& str);

    /**
     * calculate_log_checksum
     * Digest of the compact dump of the log's entry array. nlohmann::json
     * orders object keys, so equal entries always dump identically.
     */
    static std::string calculate_log_checksum(const json& entries);
};

} // namespace dsync

#endif // DSYNC_CRYPTO_HPP
