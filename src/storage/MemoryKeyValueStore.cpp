/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: MemoryKeyValueStore.cpp
 * ============================================================================
 */

#include "MemoryKeyValueStore.hpp"

namespace dsync {

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    values_[key] = value;
    ++writes_;
}

void MemoryKeyValueStore::remove(const std::string& key) {
    values_.erase(key);
}

} // namespace dsync
