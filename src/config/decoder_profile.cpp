#include "arsc/decoder_profile.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

namespace arsc {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

DecoderProfile get_builtin_profile() {
    DecoderProfile profile;
    profile.schema = DECODER_PROFILE_SCHEMA;
    profile.strict = true;
    return profile;
}

DecoderProfileParseResult parse_decoder_profile(const std::string& json_str,
                                                const std::string& source_path) {
    DecoderProfileParseResult result;
    result.profile.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.profile.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.profile.schema != DECODER_PROFILE_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + DECODER_PROFILE_SCHEMA;
            return result;
        }

        if (j.contains("strict")) {
            if (j["strict"].is_boolean()) {
                result.profile.strict = j["strict"].get<bool>();
            } else {
                result.warnings.push_back("invalid_configuration:strict_not_boolean");
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                if (!val.is_string()) continue;

                std::string key_str = to_lower(key);
                auto warning = parse_warning_key(key_str);
                if (!warning) {
                    result.warnings.push_back("invalid_configuration:unknown_warning_key:" + key_str);
                    continue;
                }

                auto action = parse_warning_action(val.get<std::string>());
                if (!action) {
                    result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                    result.profile.warnings[key_str] = WarningAction::Warn;
                    continue;
                }

                // Only reserved-field violations may abort a parse
                if (*action == WarningAction::Error && *warning != Warning::format_violation) {
                    result.warnings.push_back("invalid_configuration:error_not_allowed:" + key_str);
                    result.profile.warnings[key_str] = WarningAction::Warn;
                    continue;
                }

                result.profile.warnings[key_str] = *action;
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

DecoderProfileParseResult load_decoder_profile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        DecoderProfileParseResult result;
        result.error = "failed to open " + path;
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_decoder_profile(buffer.str(), path);
}

ParseOptions to_parse_options(const DecoderProfile& profile) {
    ParseOptions options;
    options.warnings = profile.warnings;

    // An explicit format_violation action takes precedence over "strict"
    auto it = profile.warnings.find(warning_to_string(Warning::format_violation));
    if (it != profile.warnings.end()) {
        options.strict = it->second == WarningAction::Error;
    } else {
        options.strict = profile.strict;
    }
    return options;
}

} // namespace arsc
