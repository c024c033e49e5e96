/**
 * arsc CLI - strings command
 *
 * Print the global string pool.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace arsc::cli::commands {

namespace {

struct StringsOptions {
    std::vector<std::string> files;
};

int cmd_strings(const GlobalOptions& opts, const StringsOptions& strings_opts) {
    configure_logging(opts);

    auto loaded = load_tables(strings_opts.files, opts);
    if (!loaded.ok) return 1;

    auto entries = loaded.table.global_string_pool().entries();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["strings"] = nlohmann::json::array();
        for (const auto& [index, value] : entries) {
            j["strings"].push_back(nlohmann::json{{"index", index}, {"value", value}});
        }
        output_json(j);
    } else {
        for (const auto& [index, value] : entries) {
            std::cout << index << ": " << value << std::endl;
        }
    }

    return 0;
}

} // anonymous namespace

void setup_strings(CLI::App* app, GlobalOptions& opts) {
    static StringsOptions strings_opts;

    app->add_option("files", strings_opts.files, "resources.arsc files")->required()->check(CLI::ExistingFile);

    app->callback([&opts]() {
        std::exit(cmd_strings(opts, strings_opts));
    });
}

} // namespace arsc::cli::commands
