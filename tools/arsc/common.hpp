/**
 * arsc CLI - Common utilities and types
 */

#pragma once

#include <arsc/decoder_profile.hpp>
#include <arsc/table_json.hpp>
#include <arsc/table_parser.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifndef ARSC_VERSION
#define ARSC_VERSION "0.1.0"
#endif

namespace arsc::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool lenient = false;          // --lenient
    std::string profile;           // --profile
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route decoder logging to stderr so --json output stays parseable.
 */
inline void configure_logging(const GlobalOptions& opts) {
    static auto logger = spdlog::stderr_color_mt("arsc");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%^%l%$: %v");

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

/**
 * Decoder options from --profile, then --lenient.
 */
inline std::optional<ParseOptions> resolve_parse_options(const GlobalOptions& opts) {
    DecoderProfile profile = get_builtin_profile();

    if (!opts.profile.empty()) {
        auto loaded = load_decoder_profile(opts.profile);
        if (!loaded.ok) {
            print_error("invalid profile " + opts.profile + ": " + loaded.error, opts.json);
            return std::nullopt;
        }
        for (const auto& w : loaded.warnings) {
            spdlog::warn("{}: {}", opts.profile, w);
        }
        profile = loaded.profile;
    }

    ParseOptions options = to_parse_options(profile);
    if (opts.lenient) options.strict = false;
    return options;
}

/**
 * Tables parsed from one or more files, merged in command-line order.
 */
struct LoadedTables {
    bool ok = false;
    ResourceTable table;
    std::vector<WarningObject> warnings;
};

inline LoadedTables load_tables(const std::vector<std::string>& files, const GlobalOptions& opts) {
    LoadedTables loaded;

    auto options = resolve_parse_options(opts);
    if (!options) return loaded;

    TableParser parser(*options);
    bool first = true;
    for (const auto& file : files) {
        auto result = parser.parse_file(file);
        loaded.warnings.insert(loaded.warnings.end(), result.warnings.begin(), result.warnings.end());
        if (!result.ok) {
            if (opts.json) {
                nlohmann::json j;
                j["ok"] = false;
                j["file"] = file;
                j["error"] = parse_error_to_json(result.error);
                j["warnings"] = warnings_to_json(loaded.warnings);
                output_json(j);
            } else {
                std::cerr << "Error: " << file << ": " << error_kind_to_string(result.error.kind) << ": "
                          << result.error.to_string() << std::endl;
            }
            return loaded;
        }

        if (first) {
            loaded.table = std::move(result.table);
            first = false;
        } else {
            loaded.table.add_all(result.table);
        }
    }

    loaded.ok = true;
    return loaded;
}

/**
 * Accepts "0x7f010000" or a decimal id.
 */
inline std::optional<uint32_t> parse_id_argument(const std::string& text) {
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed, 0);
        if (consumed != text.size() || value > 0xFFFFFFFFul) return std::nullopt;
        return static_cast<uint32_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace arsc::cli
