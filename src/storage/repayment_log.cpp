/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: repayment_log.cpp
 * ============================================================================
 */

#include "repayment_log.hpp"
#include "../core/crypto.hpp"
#include "../core/dsync_json.hpp"
#include "../core/logging.hpp"

#include <cstdint>
#include <limits>

namespace dsync {

namespace {

Timestamp timestamp_or(const json& value, Timestamp fallback) {
    if (!value.is_string()) return fallback;
    auto parsed = parse_iso8601(value.get<std::string>());
    return parsed ? *parsed : fallback;
}

// Optional numeric field: absent -> 0, present but not a number -> invalid.
bool optional_number(const json& entry, const char* field, double& out) {
    out = 0.0;
    if (!entry.contains(field) || entry[field].is_null()) return true;
    if (!entry[field].is_number()) return false;
    out = entry[field].get<double>();
    return true;
}

// Whole number within [0, INT_MAX]; fractions and floats are rejected.
std::optional<int> applied_count_of(const json& value) {
    if (!value.is_number_integer()) return std::nullopt;

    if (value.is_number_unsigned()) {
        auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(raw);
    }

    auto raw = value.get<std::int64_t>();
    if (raw < 0 || raw > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(raw);
}

std::optional<RepaymentLogEntry> decode_entry(const json& e, Timestamp now) {
    if (!e.is_object()) return std::nullopt;
    if (!e.contains("position_id") || !e["position_id"].is_string()) return std::nullopt;
    if (!e.contains("applied_count")) return std::nullopt;
    if (!e.contains("cached_balance") || !e["cached_balance"].is_number()) return std::nullopt;

    std::optional<int> applied = applied_count_of(e["applied_count"]);
    if (!applied) return std::nullopt;

    RepaymentLogEntry entry;
    entry.position_id = e["position_id"].get<std::string>();
    entry.applied_count = *applied;
    entry.cached_balance = e["cached_balance"].get<double>();

    if (!optional_number(e, "cumulative_interest", entry.cumulative_interest)) return std::nullopt;
    if (!optional_number(e, "cumulative_principal", entry.cumulative_principal)) return std::nullopt;

    entry.last_synced_at = e.contains("last_synced_at") ? timestamp_or(e["last_synced_at"], now) : now;
    return entry;
}

} // namespace

const RepaymentLogEntry* RepaymentLog::find(const std::string& position_id) const {
    auto it = entries.find(position_id);
    return it == entries.end() ? nullptr : &it->second;
}

void RepaymentLog::upsert(const RepaymentLogEntry& entry) {
    entries[entry.position_id] = entry;
}

bool RepaymentLog::erase(const std::string& position_id) {
    return entries.erase(position_id) > 0;
}

RepaymentLog make_empty_log(Timestamp now) {
    RepaymentLog log;
    log.updated_at = now;
    return log;
}

std::string encode_log(const RepaymentLog& log) {
    json entries = json::array();
    for (const auto& pair : log.entries) {
        const RepaymentLogEntry& e = pair.second;
        entries.push_back({
            {"position_id", e.position_id},
            {"applied_count", e.applied_count},
            {"cached_balance", e.cached_balance},
            {"cumulative_interest", e.cumulative_interest},
            {"cumulative_principal", e.cumulative_principal},
            {"last_synced_at", format_iso8601(e.last_synced_at)},
        });
    }

    json doc = {
        {"entries", entries},
        {"updated_at", format_iso8601(log.updated_at)},
        {"checksum", DsyncCrypto::calculate_log_checksum(entries)},
    };
    return doc.dump();
}

std::optional<RepaymentLog> decode_log(const std::string& raw, Timestamp now) {
    json doc;
    try {
        doc = json::parse(raw);
    } catch (const json::parse_error& e) {
        dsync_log("ERROR", std::string("Repayment log is not valid JSON: ") + e.what());
        return std::nullopt;
    }

    if (!doc.is_object() || !doc.contains("entries") || !doc["entries"].is_array() ||
        !doc.contains("updated_at") || !doc["updated_at"].is_string()) {
        dsync_log("WARN", "Repayment log has invalid shape, returning empty log.");
        return std::nullopt;
    }

    if (doc.contains("checksum")) {
        if (!doc["checksum"].is_string() ||
            doc["checksum"].get<std::string>() != DsyncCrypto::calculate_log_checksum(doc["entries"])) {
            dsync_log("WARN", "Repayment log checksum mismatch, returning empty log.");
            return std::nullopt;
        }
    }

    RepaymentLog log;
    log.updated_at = timestamp_or(doc["updated_at"], now);

    for (const auto& e : doc["entries"]) {
        auto entry = decode_entry(e, now);
        if (!entry) {
            dsync_log("WARN", "Repayment log entry has invalid shape, returning empty log.");
            return std::nullopt;
        }
        log.upsert(*entry);
    }

    return log;
}

} // namespace dsync
