#include "arsc/resource_table.hpp"

#include <algorithm>
#include <set>
#include <unordered_set>

namespace arsc {

// ============================================================================
// Config / Type / Package
// ============================================================================

void Config::add_all(const Config& other) {
    resources.insert(resources.end(), other.resources.begin(), other.resources.end());
}

const Config* Type::configuration(const ResTableConfig& config) const {
    for (const auto& c : configs) {
        if (c.config == config) return &c;
    }
    return nullptr;
}

Config* Type::configuration(const ResTableConfig& config) {
    for (auto& c : configs) {
        if (c.config == config) return &c;
    }
    return nullptr;
}

std::vector<const Resource*> Type::all_resources() const {
    std::vector<const Resource*> out;
    std::unordered_set<std::string> seen;
    for (const auto& c : configs) {
        for (const auto& res : c.resources) {
            if (seen.insert(res.name).second) out.push_back(&res);
        }
    }
    return out;
}

std::vector<const Resource*> Type::all_resources(uint32_t resource_id) const {
    std::vector<const Resource*> out;
    for (const auto& c : configs) {
        for (const auto& res : c.resources) {
            if (res.id == resource_id) out.push_back(&res);
        }
    }
    return out;
}

std::vector<std::string> Type::all_resource_names() const {
    std::set<std::string> names;
    for (const auto& c : configs) {
        for (const auto& res : c.resources) names.insert(res.name);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

const Resource* Type::first_resource(uint32_t resource_id) const {
    for (const auto& c : configs) {
        for (const auto& res : c.resources) {
            if (res.id == resource_id) return &res;
        }
    }
    return nullptr;
}

const Resource* Type::first_resource(const std::string& resource_name) const {
    for (const auto& c : configs) {
        for (const auto& res : c.resources) {
            if (res.name == resource_name) return &res;
        }
    }
    return nullptr;
}

bool Type::is_public(uint32_t entry_index) const {
    if (entry_index >= spec_flags.size()) return false;
    return (spec_flags[entry_index] & SPEC_PUBLIC) != 0;
}

void Type::add_all(const Type& other) {
    for (const auto& c : other.configs) {
        if (Config* existing = configuration(c.config)) {
            existing->add_all(c);
        } else {
            configs.push_back(c);
        }
    }
    if (spec_flags.empty()) spec_flags = other.spec_flags;
}

const Type* Package::resource_type(const std::string& type_name) const {
    for (const auto& t : types) {
        if (t.name == type_name) return &t;
    }
    return nullptr;
}

const Type* Package::type(uint32_t type_id, const std::string& type_name) const {
    for (const auto& t : types) {
        if (t.id == type_id && t.name == type_name) return &t;
    }
    return nullptr;
}

Type* Package::type(uint32_t type_id, const std::string& type_name) {
    for (auto& t : types) {
        if (t.id == type_id && t.name == type_name) return &t;
    }
    return nullptr;
}

void Package::add_all(const Package& other) {
    for (const auto& t : other.types) {
        if (Type* existing = type(t.id, t.name)) {
            existing->add_all(t);
        } else {
            types.push_back(t);
        }
    }
}

// ============================================================================
// ResourceTable
// ============================================================================

const Package* ResourceTable::package(uint32_t package_id, const std::string& package_name) const {
    for (const auto& p : packages_) {
        if (p.id == package_id && p.name == package_name) return &p;
    }
    return nullptr;
}

Package* ResourceTable::package(uint32_t package_id, const std::string& package_name) {
    for (auto& p : packages_) {
        if (p.id == package_id && p.name == package_name) return &p;
    }
    return nullptr;
}

const Resource* ResourceTable::find_resource(uint32_t resource_id) const {
    const Type* type = find_resource_type(resource_id);
    if (!type) return nullptr;
    return type->first_resource(resource_id);
}

std::vector<const Resource*> ResourceTable::find_all_resources(uint32_t resource_id) const {
    std::vector<const Resource*> out;
    ResourceId id = parse_resource_id(resource_id);
    for (const auto& p : packages_) {
        if (p.id != id.package_id) continue;
        for (const auto& t : p.types) {
            if (t.id != id.type_id) continue;
            auto matches = t.all_resources(resource_id);
            out.insert(out.end(), matches.begin(), matches.end());
        }
        break;
    }
    return out;
}

const Type* ResourceTable::find_resource_type(uint32_t resource_id) const {
    ResourceId id = parse_resource_id(resource_id);
    for (const auto& p : packages_) {
        if (p.id != id.package_id) continue;
        for (const auto& t : p.types) {
            if (t.id == id.type_id) return &t;
        }
        break;
    }
    return nullptr;
}

const Resource* ResourceTable::find_resource_by_name(const std::string& type_name,
                                                     const std::string& resource_name) const {
    for (const auto& p : packages_) {
        const Type* type = p.resource_type(type_name);
        if (!type) continue;
        for (const Resource* res : type->all_resources()) {
            if (res->name == resource_name) return res;
        }
    }
    return nullptr;
}

std::optional<std::string> ResourceTable::find_string_resource(const std::string& resource_name) const {
    const Resource* res = find_resource_by_name("string", resource_name);
    if (!res) return std::nullopt;
    if (const auto* str = res->as<StringValue>()) return str->value;
    return std::nullopt;
}

std::vector<const Resource*> ResourceTable::find_resources_by_type(const std::string& type_name) const {
    std::vector<const Resource*> out;
    for (const auto& p : packages_) {
        const Type* type = p.resource_type(type_name);
        if (!type) continue;
        auto resources = type->all_resources();
        out.insert(out.end(), resources.begin(), resources.end());
    }
    return out;
}

void ResourceTable::add_all(const ResourceTable& other) {
    if (&other == this) return;

    for (const auto& p : other.packages_) {
        if (Package* existing = package(p.id, p.name)) {
            existing->add_all(p);
        } else {
            packages_.push_back(p);
        }
    }

    global_pool_.merge(other.global_pool_);
}

} // namespace arsc
