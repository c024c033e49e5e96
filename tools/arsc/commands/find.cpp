/**
 * arsc CLI - find command
 *
 * Look up resources by numeric id (every configuration) or by type/name.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace arsc::cli::commands {

namespace {

struct FindOptions {
    std::vector<std::string> files;
    std::string id;
    std::string name;  // type/name
};

int find_by_id(const GlobalOptions& opts, const ResourceTable& table, uint32_t id) {
    auto matches = table.find_all_resources(id);
    if (matches.empty()) {
        print_error("no resource with id " + format_resource_id(id), opts.json);
        return 1;
    }

    const Type* type = table.find_resource_type(id);
    ResourceId parts = parse_resource_id(id);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["id"] = format_resource_id(id);
        j["type"] = type ? type->name : "";
        j["resources"] = nlohmann::json::array();
        for (const Resource* res : matches) j["resources"].push_back(resource_to_json(*res));
        output_json(j);
    } else {
        std::cout << format_resource_id(id) << " (" << parts.to_string() << ")";
        if (type) std::cout << " type " << type->name;
        std::cout << std::endl;
        for (const Resource* res : matches) {
            std::cout << "  " << res->name << " (" << res->kind() << ") = " << res->to_string() << std::endl;
        }
    }
    return 0;
}

int find_by_name(const GlobalOptions& opts, const ResourceTable& table, const std::string& spec) {
    auto slash = spec.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == spec.size()) {
        print_error("--name expects type/name, got '" + spec + "'", opts.json);
        return 1;
    }
    std::string type_name = spec.substr(0, slash);
    std::string resource_name = spec.substr(slash + 1);

    const Resource* res = table.find_resource_by_name(type_name, resource_name);
    if (!res) {
        print_error("no resource " + spec, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["resource"] = resource_to_json(*res);
        output_json(j);
    } else {
        std::cout << format_resource_id(res->id) << " " << res->name << " (" << res->kind()
                  << ") = " << res->to_string() << std::endl;
    }
    return 0;
}

int cmd_find(const GlobalOptions& opts, const FindOptions& find_opts) {
    configure_logging(opts);

    std::optional<uint32_t> id;
    if (!find_opts.id.empty()) {
        id = parse_id_argument(find_opts.id);
        if (!id) {
            print_error("invalid resource id '" + find_opts.id + "'", opts.json);
            return 1;
        }
    } else if (find_opts.name.empty()) {
        print_error("one of --id or --name is required", opts.json);
        return 1;
    }

    auto loaded = load_tables(find_opts.files, opts);
    if (!loaded.ok) return 1;

    if (id) return find_by_id(opts, loaded.table, *id);
    return find_by_name(opts, loaded.table, find_opts.name);
}

} // anonymous namespace

void setup_find(CLI::App* app, GlobalOptions& opts) {
    static FindOptions find_opts;

    app->add_option("files", find_opts.files, "resources.arsc files")->required()->check(CLI::ExistingFile);
    auto* id_opt = app->add_option("--id", find_opts.id, "Resource id, e.g. 0x7f010000");
    auto* name_opt = app->add_option("--name", find_opts.name, "Resource as type/name, e.g. string/app_name");
    id_opt->excludes(name_opt);

    app->callback([&opts]() {
        std::exit(cmd_find(opts, find_opts));
    });
}

} // namespace arsc::cli::commands
