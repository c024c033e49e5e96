/**
 * arsc CLI - types command
 *
 * List the resources of one type across all packages, one entry per name.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace arsc::cli::commands {

namespace {

struct TypesOptions {
    std::string file;
    std::string type;
};

int cmd_types(const GlobalOptions& opts, const TypesOptions& types_opts) {
    configure_logging(opts);

    auto loaded = load_tables({types_opts.file}, opts);
    if (!loaded.ok) return 1;

    auto resources = loaded.table.find_resources_by_type(types_opts.type);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["type"] = types_opts.type;
        j["resources"] = nlohmann::json::array();
        for (const Resource* res : resources) j["resources"].push_back(resource_to_json(*res));
        output_json(j);
    } else if (resources.empty()) {
        std::cout << "No resources of type " << types_opts.type << "." << std::endl;
    } else {
        for (const Resource* res : resources) {
            std::cout << format_resource_id(res->id) << " " << res->name << " = " << res->to_string()
                      << std::endl;
        }
    }

    return 0;
}

} // anonymous namespace

void setup_types(CLI::App* app, GlobalOptions& opts) {
    static TypesOptions types_opts;

    app->add_option("file", types_opts.file, "resources.arsc file")->required()->check(CLI::ExistingFile);
    app->add_option("type", types_opts.type, "Resource type, e.g. string")->required();

    app->callback([&opts]() {
        std::exit(cmd_types(opts, types_opts));
    });
}

} // namespace arsc::cli::commands
