#include <doctest/doctest.h>
#include <arsc/decode_context.hpp>
#include <arsc/types.hpp>
#include <arsc/warnings.hpp>

using namespace arsc;

TEST_CASE("warning_to_string returns correct warning key") {
    CHECK(std::string(warning_to_string(Warning::format_violation)) == "format_violation");
    CHECK(std::string(warning_to_string(Warning::unsupported_entry_flags)) == "unsupported_entry_flags");
    CHECK(std::string(warning_to_string(Warning::malformed_value)) == "malformed_value");
    CHECK(std::string(warning_to_string(Warning::missing_string)) == "missing_string");
}

TEST_CASE("parse_warning_key parses known warning keys") {
    CHECK(parse_warning_key("format_violation") == Warning::format_violation);
    CHECK(parse_warning_key("invalid_dimension_unit") == Warning::invalid_dimension_unit);
    CHECK(parse_warning_key("config_trailing_bytes") == Warning::config_trailing_bytes);
    CHECK(parse_warning_key("Entry_Out_Of_Bounds") == Warning::entry_out_of_bounds);
}

TEST_CASE("parse_warning_key returns nullopt for unknown keys") {
    CHECK_FALSE(parse_warning_key("unknown_warning").has_value());
    CHECK_FALSE(parse_warning_key("").has_value());
    CHECK_FALSE(parse_warning_key("not_a_warning").has_value());
}

TEST_CASE("parse_warning_action accepts warn, ignore and error") {
    CHECK(parse_warning_action("warn") == WarningAction::Warn);
    CHECK(parse_warning_action("IGNORE") == WarningAction::Ignore);
    CHECK(parse_warning_action("error") == WarningAction::Error);
    CHECK_FALSE(parse_warning_action("fatal").has_value());
}

TEST_CASE("WarningCollector default policy is warn") {
    WarningCollector collector;

    collector.emit(Warning::missing_string, warnings::missing_string("global", 9));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "warn");
    CHECK(warnings[0].key == "missing_string");
    CHECK(warnings[0].fields.at("pool") == "global");
    CHECK(warnings[0].fields.at("index") == "9");
}

TEST_CASE("WarningCollector applies error policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["format_violation"] = WarningAction::Error;

    WarningCollector collector(policy);
    CHECK(collector.action_for(Warning::format_violation) == WarningAction::Error);
    collector.emit(Warning::format_violation, warnings::format_violation("res0 is not zero", 0x1c));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "error");
    CHECK(warnings[0].fields.at("offset") == "0x1c");
}

TEST_CASE("WarningCollector drops ignored warnings from the report") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["unknown_data_type"] = WarningAction::Ignore;

    WarningCollector collector(policy);
    collector.emit(Warning::unknown_data_type, warnings::unknown_data_type("broken", 0x7f));
    CHECK(collector.get_warnings().empty());

    collector.emit(Warning::malformed_value, warnings::malformed_value("odd", "size 12", 0x40));
    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "malformed_value");
    CHECK(warnings[0].fields.at("reason") == "size 12");
}

TEST_CASE("WarningCollector falls back to warn outside the policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["missing_string"] = WarningAction::Ignore;

    WarningCollector collector(policy);
    CHECK(collector.action_for(Warning::missing_string) == WarningAction::Ignore);
    CHECK(collector.action_for(Warning::entry_out_of_bounds) == WarningAction::Warn);
}

TEST_CASE("WarningCollector keeps warnings in emission order") {
    WarningCollector collector;

    collector.emit(Warning::malformed_value, warnings::malformed_value("a", "size 9", 0));
    collector.emit(Warning::unknown_data_type, warnings::unknown_data_type("b", 0x20));
    collector.emit(Warning::entry_out_of_bounds, warnings::entry_out_of_bounds(3, 0x100));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 3);
    CHECK(warnings[0].key == "malformed_value");
    CHECK(warnings[1].key == "unknown_data_type");
    CHECK(warnings[2].key == "entry_out_of_bounds");
    CHECK(warnings[2].fields.at("entry") == "3");
}

TEST_CASE("unsupported_entry_flags fields name both flags") {
    CHECK(warnings::unsupported_entry_flags(true, false).at("flags") == "FLAG_WEAK");
    CHECK(warnings::unsupported_entry_flags(false, true).at("flags") == "FLAG_COMPACT");
    CHECK(warnings::unsupported_entry_flags(true, true).at("flags") == "FLAG_WEAK FLAG_COMPACT");
}

TEST_CASE("ParseError to_string appends the offset") {
    auto error = make_error(ErrorKind::FormatViolation, "res0 is not zero", 0x1c);
    CHECK(error.to_string() == "res0 is not zero offset=0x1c");
    CHECK(std::string(error_kind_to_string(error.kind)) == "FORMAT_VIOLATION");
}

// ============================================================================
// DecodeContext policy
// ============================================================================

TEST_CASE("strict context makes format violations fatal") {
    DecodeContext ctx(strict_options());
    ParseError error;

    CHECK_FALSE(ctx.format_violation("reserved is not zero", 0x20, error));
    CHECK(error.kind == ErrorKind::FormatViolation);
    CHECK(error.offset == 0x20);

    auto warnings = ctx.warnings.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "error");
}

TEST_CASE("lenient context records format violations as warnings") {
    DecodeContext ctx(lenient_options());
    ParseError error;

    CHECK(ctx.format_violation("reserved is not zero", 0x20, error));
    CHECK(error.kind == ErrorKind::None);

    auto warnings = ctx.warnings.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "format_violation");
    CHECK(warnings[0].action == "warn");
}

TEST_CASE("lenient context keeps an explicit ignore for format violations") {
    ParseOptions options = lenient_options();
    options.warnings["format_violation"] = WarningAction::Ignore;
    DecodeContext ctx(options);
    ParseError error;

    CHECK(ctx.format_violation("res0 is not zero", 4, error));
    CHECK(ctx.warnings.get_warnings().empty());
}

TEST_CASE("config_trailing_bytes is ignored unless configured") {
    DecodeContext quiet(strict_options());
    CHECK(quiet.warnings.action_for(Warning::config_trailing_bytes) == WarningAction::Ignore);

    ParseOptions options;
    options.warnings["config_trailing_bytes"] = WarningAction::Warn;
    DecodeContext loud(options);
    CHECK(loud.warnings.action_for(Warning::config_trailing_bytes) == WarningAction::Warn);
}
