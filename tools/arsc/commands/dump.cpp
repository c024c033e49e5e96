/**
 * arsc CLI - dump command
 *
 * Print the full package / type / configuration / resource tree of one or
 * more resource tables, merged in command-line order.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace arsc::cli::commands {

namespace {

struct DumpOptions {
    std::vector<std::string> files;
};

void print_table(const ResourceTable& table) {
    for (const auto& package : table.packages()) {
        std::cout << "Package " << package.id << " (" << package.name << ")" << std::endl;
        for (const auto& type : package.types) {
            std::cout << "  Type " << type.id << " " << type.name << " (" << type.configs.size()
                      << " configs)" << std::endl;
            for (const auto& config : type.configs) {
                std::string qualifiers = config.config.to_string();
                std::cout << "    Config " << (qualifiers.empty() ? "[default]" : qualifiers) << std::endl;
                for (const auto& res : config.resources) {
                    std::cout << "      " << format_resource_id(res.id) << " " << res.name << " ("
                              << res.kind() << ") = " << res.to_string() << std::endl;
                }
            }
        }
    }
}

int cmd_dump(const GlobalOptions& opts, const DumpOptions& dump_opts) {
    configure_logging(opts);

    auto loaded = load_tables(dump_opts.files, opts);
    if (!loaded.ok) return 1;

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["table"] = table_to_json(loaded.table);
        j["warnings"] = warnings_to_json(loaded.warnings);
        output_json(j);
    } else {
        print_table(loaded.table);
    }

    return 0;
}

} // anonymous namespace

void setup_dump(CLI::App* app, GlobalOptions& opts) {
    static DumpOptions dump_opts;

    app->add_option("files", dump_opts.files, "resources.arsc files")->required()->check(CLI::ExistingFile);

    app->callback([&opts]() {
        std::exit(cmd_dump(opts, dump_opts));
    });
}

} // namespace arsc::cli::commands
