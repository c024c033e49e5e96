#pragma once

#include "arsc/config.hpp"
#include "arsc/resource.hpp"
#include "arsc/string_pool.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arsc {

// ============================================================================
// Table Model
// ============================================================================

// Resources that apply to one device configuration
struct Config {
    ResTableConfig config;
    std::vector<Resource> resources;

    void add_all(const Config& other);
};

struct Type {
    uint32_t id = 0;
    std::string name;
    std::vector<uint32_t> spec_flags;
    std::vector<Config> configs;

    // nullptr when no configuration compares equal
    const Config* configuration(const ResTableConfig& config) const;
    Config* configuration(const ResTableConfig& config);

    // One resource per name across all configurations; the first configuration wins
    std::vector<const Resource*> all_resources() const;

    // Every resource with the given id, in configuration order
    std::vector<const Resource*> all_resources(uint32_t resource_id) const;

    // Distinct names, sorted
    std::vector<std::string> all_resource_names() const;

    const Resource* first_resource(uint32_t resource_id) const;
    const Resource* first_resource(const std::string& name) const;

    // SPEC_PUBLIC set in the type spec for entry_index
    bool is_public(uint32_t entry_index) const;

    void add_all(const Type& other);
};

struct Package {
    uint32_t id = 0;
    std::string name;
    std::vector<Type> types;

    // First type with the given name
    const Type* resource_type(const std::string& type_name) const;

    const Type* type(uint32_t type_id, const std::string& type_name) const;
    Type* type(uint32_t type_id, const std::string& type_name);

    void add_all(const Package& other);
};

// ============================================================================
// Resource Table
// ============================================================================

// Decoded resources.arsc contents. Pointers returned by queries stay valid until the
// table is modified by add_all.
class ResourceTable {
public:
    const std::vector<Package>& packages() const { return packages_; }
    const StringPool& global_string_pool() const { return global_pool_; }

    const Package* package(uint32_t package_id, const std::string& package_name) const;

    // Configuration-agnostic: the first match in the first package carrying the id's package number
    const Resource* find_resource(uint32_t resource_id) const;

    std::vector<const Resource*> find_all_resources(uint32_t resource_id) const;

    const Type* find_resource_type(uint32_t resource_id) const;

    // type_name is the resource type string, e.g. "string" or "drawable"
    const Resource* find_resource_by_name(const std::string& type_name,
                                          const std::string& resource_name) const;

    // Value of a String resource of type "string"
    std::optional<std::string> find_string_resource(const std::string& resource_name) const;

    std::vector<const Resource*> find_resources_by_type(const std::string& type_name) const;

    // Merge packages by (id, name), types by (id, name) and configs by equality.
    // Unmatched children are appended; matching configs concatenate their resources.
    void add_all(const ResourceTable& other);

private:
    friend class TableDecoder;

    Package* package(uint32_t package_id, const std::string& package_name);

    std::vector<Package> packages_;
    StringPool global_pool_;
};

} // namespace arsc
