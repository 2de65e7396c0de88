/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: MemoryKeyValueStore.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Process-local backend. Holds values in a map for the lifetime of the
 * object; used for ephemeral sessions and throughout the test suite.
 * ============================================================================
 */

#ifndef DSYNC_MEMORY_KV_STORE_HPP
#define DSYNC_MEMORY_KV_STORE_HPP

#include "interface/kv_store.hpp"

#include <cstddef>
#include <map>

namespace dsync {

    class MemoryKeyValueStore : public KeyValueStore {
    public:
        std::optional<std::string> get(const std::string& key) override;
        void set(const std::string& key, const std::string& value) override;
        void remove(const std::string& key) override;

        // Number of set() calls so far. Lets callers observe skipped writes.
        std::size_t write_count() const { return writes_; }

    private:
        std::map<std::string, std::string> values_;
        std::size_t writes_ = 0;
    };

} // namespace dsync

#endif // DSYNC_MEMORY_KV_STORE_HPP
