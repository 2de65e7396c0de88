/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: kv_store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Storage SDK header. The sync engine persists exactly one document under
 * one namespaced key; any backend that can hold string values by key can
 * serve it. Inherit from KeyValueStore and implement the virtual methods.
 * * CONTRACT:
 * Backends report every I/O failure by throwing dsync::StoreError. A key
 * that simply does not exist is not a failure.
 * ============================================================================
 */

#ifndef DSYNC_KV_STORE_HPP
#define DSYNC_KV_STORE_HPP

#include <optional>
#include <string>

namespace dsync {

    class KeyValueStore {
    public:
        virtual ~KeyValueStore() {}

        /**
         * @return The stored value, or std::nullopt when the key is absent.
         */
        virtual std::optional<std::string> get(const std::string& key) = 0;

        // Creates or replaces the value.
        virtual void set(const std::string& key, const std::string& value) = 0;

        // Removing an absent key is a no-op.
        virtual void remove(const std::string& key) = 0;
    };

} // namespace dsync

#endif // DSYNC_KV_STORE_HPP
