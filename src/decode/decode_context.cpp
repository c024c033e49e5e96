#include "arsc/decode_context.hpp"

namespace arsc {

namespace {

std::unordered_map<std::string, WarningAction> build_policy(const ParseOptions& options) {
    auto policy = options.warnings;
    // Newer platforms fill the config tail routinely; only surface it at debug level
    policy.emplace(warning_to_string(Warning::config_trailing_bytes), WarningAction::Ignore);
    const std::string violation = warning_to_string(Warning::format_violation);
    if (options.strict) {
        policy[violation] = WarningAction::Error;
    } else if (policy.count(violation) == 0 || policy[violation] == WarningAction::Error) {
        policy[violation] = WarningAction::Warn;
    }
    return policy;
}

} // namespace

DecodeContext::DecodeContext(const ParseOptions& options)
    : warnings(build_policy(options)) {}

bool DecodeContext::format_violation(const std::string& message, size_t offset, ParseError& error) {
    warnings.emit(Warning::format_violation, warnings::format_violation(message, offset));
    if (warnings.action_for(Warning::format_violation) == WarningAction::Error) {
        error = make_error(ErrorKind::FormatViolation, message, offset);
        return false;
    }
    return true;
}

} // namespace arsc
