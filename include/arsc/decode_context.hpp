#pragma once

#include "arsc/types.hpp"
#include "arsc/warnings.hpp"

#include <string>
#include <unordered_map>

namespace arsc {

// ============================================================================
// Parse Options
// ============================================================================

struct ParseOptions {
    // Strict mode turns reserved-field violations into fatal FORMAT_VIOLATION errors.
    bool strict = true;

    // Per-warning actions (warn | ignore). Strict forces format_violation to error.
    std::unordered_map<std::string, WarningAction> warnings;
};

inline ParseOptions strict_options() {
    return ParseOptions{};
}

inline ParseOptions lenient_options() {
    ParseOptions options;
    options.strict = false;
    return options;
}

// ============================================================================
// Decode Context
// ============================================================================

// Mutable per-parse state shared by the component decoders.
struct DecodeContext {
    explicit DecodeContext(const ParseOptions& options);

    WarningCollector warnings;
    bool warned_weak = false;
    bool warned_compact = false;

    // Reports a reserved-field violation. Returns false when the active policy makes it fatal,
    // in which case error holds the FORMAT_VIOLATION to propagate.
    bool format_violation(const std::string& message, size_t offset, ParseError& error);
};

} // namespace arsc
