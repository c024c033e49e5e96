#pragma once

#include "arsc/decode_context.hpp"
#include "arsc/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace arsc {

// ============================================================================
// Decoder Profile
// ============================================================================

constexpr const char* DECODER_PROFILE_SCHEMA = "arsc.decoder.profile.v1";

struct DecoderProfile {
    std::string schema;  // MUST be "arsc.decoder.profile.v1"

    // Reserved-field violations abort the parse when true
    bool strict = true;

    // "warnings" section - maps warning key to action
    std::unordered_map<std::string, WarningAction> warnings;

    // Source path for diagnostics
    std::string source_path;
};

// Strict, every warning at its default action
DecoderProfile get_builtin_profile();

// ============================================================================
// Decoder Profile Parsing Result
// ============================================================================

struct DecoderProfileParseResult {
    bool ok = false;
    std::string error;
    DecoderProfile profile;
    std::vector<std::string> warnings;
};

// Parse a decoder profile from a JSON string
DecoderProfileParseResult parse_decoder_profile(const std::string& json_str,
                                                const std::string& source_path = "");

// Read and parse a decoder profile file
DecoderProfileParseResult load_decoder_profile(const std::string& path);

// ============================================================================
// Warning Policy Application
// ============================================================================

ParseOptions to_parse_options(const DecoderProfile& profile);

} // namespace arsc
