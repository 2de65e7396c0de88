/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: crypto.cpp
 * ============================================================================
 */

#include "crypto.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace dsync {

std::string DsyncCrypto::generate_sha256(const std::string& str) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context) {
        throw std::runtime_error("OpenSSL: unable to allocate digest context.");
    }

    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), NULL) != 1 ||
        EVP_DigestUpdate(context.get(), str.c_str(), str.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), hash, &length) != 1) {
        throw std::runtime_error("OpenSSL: SHA-256 digest failed.");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

std::string DsyncCrypto::calculate_log_checksum(const json& entries) {
    return generate_sha256(entries.dump());
}

} // namespace dsync
