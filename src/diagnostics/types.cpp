#include "arsc/types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <optional>

namespace arsc {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "format_violation") return Warning::format_violation;
    if (lower == "unsupported_entry_flags") return Warning::unsupported_entry_flags;
    if (lower == "malformed_value") return Warning::malformed_value;
    if (lower == "unknown_data_type") return Warning::unknown_data_type;
    if (lower == "invalid_dimension_unit") return Warning::invalid_dimension_unit;
    if (lower == "entry_out_of_bounds") return Warning::entry_out_of_bounds;
    if (lower == "config_trailing_bytes") return Warning::config_trailing_bytes;
    if (lower == "missing_string") return Warning::missing_string;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

std::string ParseError::to_string() const {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), " offset=0x%zx", offset);
    return message + buffer;
}

ParseError make_error(ErrorKind kind, const std::string& message, size_t offset) {
    ParseError error;
    error.kind = kind;
    error.message = message;
    error.offset = offset;
    return error;
}

} // namespace arsc
