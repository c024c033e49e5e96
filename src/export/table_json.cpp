#include "arsc/table_json.hpp"

#include <cstdio>
#include <type_traits>

namespace arsc {

namespace {

nlohmann::json value_to_json(const ResourceValue& value) {
    return std::visit(
        [](const auto& v) -> nlohmann::json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NullValue>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, ReferenceValue>) {
                return format_resource_id(v.reference_id);
            } else if constexpr (std::is_same_v<T, AttributeValue>) {
                return format_resource_id(v.attribute_id);
            } else if constexpr (std::is_same_v<T, ColorValue>) {
                return nlohmann::json{{"a", v.a}, {"r", v.r}, {"g", v.g}, {"b", v.b}};
            } else if constexpr (std::is_same_v<T, DimensionValue>) {
                return nlohmann::json{{"value", v.value}, {"unit", dimension_unit_to_string(v.unit)}};
            } else if constexpr (std::is_same_v<T, FractionValue>) {
                return nlohmann::json{
                    {"value", v.value},
                    {"type", v.type == FractionType::Fraction ? "fraction" : "fraction_parent"}};
            } else if constexpr (std::is_same_v<T, ArrayValue>) {
                nlohmann::json elements = nlohmann::json::array();
                for (const auto& element : v.elements) elements.push_back(value_to_json(element.value));
                return elements;
            } else if constexpr (std::is_same_v<T, ComplexMapValue>) {
                nlohmann::json entries = nlohmann::json::object();
                for (const auto& entry : v.entries) {
                    entries[entry.name] = {{"kind", entry.value.kind()},
                                           {"value", value_to_json(entry.value.value)}};
                }
                return nlohmann::json{{"res_type", v.res_type}, {"entries", entries}};
            } else {
                return v.value;
            }
        },
        value);
}

} // namespace

std::string format_resource_id(uint32_t resource_id) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%08x", resource_id);
    return buffer;
}

nlohmann::json resource_to_json(const Resource& resource) {
    nlohmann::json j;
    j["id"] = format_resource_id(resource.id);
    j["name"] = resource.name;
    j["kind"] = resource.kind();
    j["value"] = value_to_json(resource.value);
    return j;
}

nlohmann::json config_to_json(const ResTableConfig& config) {
    nlohmann::json j;
    j["size"] = config.size;
    j["qualifiers"] = config.to_string();
    if (config.mcc != 0) j["mcc"] = config.mcc;
    if (config.mnc != 0) j["mnc"] = config.mnc;
    if (!config.language_string().empty()) j["language"] = config.language_string();
    if (!config.country_string().empty()) j["country"] = config.country_string();
    if (config.orientation != 0) j["orientation"] = config.orientation;
    if (config.touchscreen != 0) j["touchscreen"] = config.touchscreen;
    if (config.density != 0) j["density"] = config.density;
    if (config.keyboard != 0) j["keyboard"] = config.keyboard;
    if (config.navigation != 0) j["navigation"] = config.navigation;
    if (config.input_flags != 0) j["input_flags"] = config.input_flags;
    if (config.screen_width != 0) j["screen_width"] = config.screen_width;
    if (config.screen_height != 0) j["screen_height"] = config.screen_height;
    if (config.sdk_version != 0) j["sdk_version"] = config.sdk_version;
    if (config.minor_version != 0) j["minor_version"] = config.minor_version;
    if (config.screen_layout != 0) j["screen_layout"] = config.screen_layout;
    if (config.ui_mode != 0) j["ui_mode"] = config.ui_mode;
    if (config.smallest_screen_width_dp != 0) {
        j["smallest_screen_width_dp"] = config.smallest_screen_width_dp;
    }
    if (config.screen_width_dp != 0) j["screen_width_dp"] = config.screen_width_dp;
    if (config.screen_height_dp != 0) j["screen_height_dp"] = config.screen_height_dp;
    if (!config.locale_script_string().empty()) j["locale_script"] = config.locale_script_string();
    if (!config.locale_variant_string().empty()) j["locale_variant"] = config.locale_variant_string();
    return j;
}

nlohmann::json type_to_json(const Type& type) {
    nlohmann::json j;
    j["id"] = type.id;
    j["name"] = type.name;
    j["configs"] = nlohmann::json::array();
    for (const auto& config : type.configs) {
        nlohmann::json c;
        c["config"] = config_to_json(config.config);
        c["resources"] = nlohmann::json::array();
        for (const auto& res : config.resources) c["resources"].push_back(resource_to_json(res));
        j["configs"].push_back(c);
    }
    return j;
}

nlohmann::json package_to_json(const Package& package) {
    nlohmann::json j;
    j["id"] = package.id;
    j["name"] = package.name;
    j["types"] = nlohmann::json::array();
    for (const auto& type : package.types) j["types"].push_back(type_to_json(type));
    return j;
}

nlohmann::json table_to_json(const ResourceTable& table) {
    nlohmann::json j;
    j["packages"] = nlohmann::json::array();
    for (const auto& package : table.packages()) j["packages"].push_back(package_to_json(package));
    j["string_pool_size"] = table.global_string_pool().size();
    return j;
}

nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& w : warnings) {
        nlohmann::json obj;
        obj["key"] = w.key;
        obj["action"] = w.action;
        obj["fields"] = nlohmann::json::object();
        for (const auto& [name, value] : w.fields) obj["fields"][name] = value;
        j.push_back(obj);
    }
    return j;
}

nlohmann::json parse_error_to_json(const ParseError& error) {
    return {{"kind", error_kind_to_string(error.kind)},
            {"message", error.message},
            {"offset", error.offset}};
}

} // namespace arsc
