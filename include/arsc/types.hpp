#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace arsc {

// ============================================================================
// Binary Layout Constants
// ============================================================================

constexpr uint16_t RES_STRING_POOL_TYPE = 0x0001;
constexpr uint16_t RES_TABLE_TYPE = 0x0002;
constexpr uint16_t RES_TABLE_PACKAGE_TYPE = 0x0200;
constexpr uint16_t RES_TABLE_TYPE_TYPE = 0x0201;
constexpr uint16_t RES_TABLE_TYPE_SPEC_TYPE = 0x0202;

// ResStringPool_header flags
constexpr uint32_t SORTED_FLAG = 1u << 0;
constexpr uint32_t UTF8_FLAG = 1u << 8;

// ResTable_typeSpec entry flags
constexpr uint32_t SPEC_PUBLIC = 0x40000000;

// ResTable_entry flags
constexpr uint16_t FLAG_COMPLEX = 0x0001;
constexpr uint16_t FLAG_PUBLIC = 0x0002;
constexpr uint16_t FLAG_WEAK = 0x0004;
constexpr uint16_t FLAG_COMPACT = 0x0008;

// ResTable_type flags
constexpr uint8_t FLAG_SPARSE = 0x01;
constexpr uint8_t FLAG_OFFSET16 = 0x02;

constexpr uint32_t NO_ENTRY = 0xFFFFFFFF;

constexpr const char* INVALID_RESOURCE_NAME = "<INVALID RESOURCE>";

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    format_violation,         // reserved field holds an unexpected value
    unsupported_entry_flags,  // FLAG_WEAK / FLAG_COMPACT on an entry
    malformed_value,          // Res_Value size > 8 or unknown entry header size
    unknown_data_type,        // Res_Value dataType outside the closed table
    invalid_dimension_unit,   // COMPLEX_UNIT outside px..mm
    entry_out_of_bounds,      // entry offset points past the buffer
    config_trailing_bytes,    // non-zero bytes beyond the known config fields
    missing_string,           // string index not present in the pool
};

inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::format_violation: return "format_violation";
        case Warning::unsupported_entry_flags: return "unsupported_entry_flags";
        case Warning::malformed_value: return "malformed_value";
        case Warning::unknown_data_type: return "unknown_data_type";
        case Warning::invalid_dimension_unit: return "invalid_dimension_unit";
        case Warning::entry_out_of_bounds: return "entry_out_of_bounds";
        case Warning::config_trailing_bytes: return "config_trailing_bytes";
        case Warning::missing_string: return "missing_string";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

// ============================================================================
// Fatal Errors
// ============================================================================

enum class ErrorKind {
    None,
    FormatViolation,
    UnsupportedFeature,
    StructuralInconsistency,
    Truncated,
    IOFailure,
};

inline const char* error_kind_to_string(ErrorKind e) {
    switch (e) {
        case ErrorKind::None: return "NONE";
        case ErrorKind::FormatViolation: return "FORMAT_VIOLATION";
        case ErrorKind::UnsupportedFeature: return "UNSUPPORTED_FEATURE";
        case ErrorKind::StructuralInconsistency: return "STRUCTURAL_INCONSISTENCY";
        case ErrorKind::Truncated: return "TRUNCATED";
        case ErrorKind::IOFailure: return "IO_FAILURE";
        default: return "UNKNOWN";
    }
}

struct ParseError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    size_t offset = 0;

    // "message offset=0x1c"
    std::string to_string() const;
};

ParseError make_error(ErrorKind kind, const std::string& message, size_t offset);

} // namespace arsc
