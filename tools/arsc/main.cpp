/**
 * arsc CLI - Entry Point
 *
 * Inspect compiled Android resource tables (resources.arsc).
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace arsc::cli::commands {
    void setup_dump(CLI::App* app, GlobalOptions& opts);
    void setup_find(CLI::App* app, GlobalOptions& opts);
    void setup_strings(CLI::App* app, GlobalOptions& opts);
    void setup_types(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace arsc::cli;

    CLI::App app{"arsc - resource table decoder"};
    app.set_version_flag("-V,--version", ARSC_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("--lenient", opts.lenient, "Log reserved-field violations instead of failing");
    app.add_option("--profile", opts.profile, "Decoder profile (JSON)");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* dump_cmd = app.add_subcommand("dump", "Print packages, types, configurations and resources");
    commands::setup_dump(dump_cmd, opts);

    auto* find_cmd = app.add_subcommand("find", "Look up a resource by id or name");
    commands::setup_find(find_cmd, opts);

    auto* strings_cmd = app.add_subcommand("strings", "Print the global string pool");
    commands::setup_strings(strings_cmd, opts);

    auto* types_cmd = app.add_subcommand("types", "List the resources of one type");
    commands::setup_types(types_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
