#pragma once

#include "arsc/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace arsc {

// ============================================================================
// Warning Collector
// ============================================================================

// Collects decode diagnostics and mirrors each one to the spdlog default logger.
// The policy maps a warning key to its action; unknown keys default to warn.
class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    // Logs the warning at its effective level and records it
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Effective action for a warning under the policy
    WarningAction action_for(Warning warning) const;

    // All emitted warnings after policy application; "ignore" entries are excluded
    std::vector<WarningObject> get_warnings() const;

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;

    WarningAction get_effective_action(const std::string& key) const;
};

// ============================================================================
// Field helpers for specific warnings
// ============================================================================

namespace warnings {

std::string hex(uint32_t value);

inline std::unordered_map<std::string, std::string> format_violation(
    const std::string& message,
    size_t offset) {
    return {{"message", message}, {"offset", hex(static_cast<uint32_t>(offset))}};
}

inline std::unordered_map<std::string, std::string> unsupported_entry_flags(
    bool weak,
    bool compact) {
    std::string flags;
    if (weak) flags += "FLAG_WEAK";
    if (compact) {
        if (!flags.empty()) flags += " ";
        flags += "FLAG_COMPACT";
    }
    return {{"flags", flags}};
}

inline std::unordered_map<std::string, std::string> malformed_value(
    const std::string& resource,
    const std::string& reason,
    size_t offset) {
    return {{"resource", resource}, {"reason", reason},
            {"offset", hex(static_cast<uint32_t>(offset))}};
}

inline std::unordered_map<std::string, std::string> unknown_data_type(
    const std::string& resource,
    uint8_t data_type) {
    return {{"resource", resource}, {"data_type", hex(data_type)}};
}

inline std::unordered_map<std::string, std::string> invalid_dimension_unit(
    const std::string& resource,
    uint32_t unit) {
    return {{"resource", resource}, {"unit", std::to_string(unit)}};
}

inline std::unordered_map<std::string, std::string> entry_out_of_bounds(
    uint32_t entry_index,
    size_t offset) {
    return {{"entry", std::to_string(entry_index)},
            {"offset", hex(static_cast<uint32_t>(offset))}};
}

inline std::unordered_map<std::string, std::string> config_trailing_bytes(
    uint32_t count) {
    return {{"count", std::to_string(count)}};
}

inline std::unordered_map<std::string, std::string> missing_string(
    const std::string& pool,
    uint32_t index) {
    return {{"pool", pool}, {"index", std::to_string(index)}};
}

} // namespace warnings

} // namespace arsc
