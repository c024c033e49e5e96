#pragma once

#include "arsc/config.hpp"
#include "arsc/resource.hpp"
#include "arsc/resource_table.hpp"
#include "arsc/types.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace arsc {

// ============================================================================
// JSON Export
// ============================================================================

// "0x7f010000"
std::string format_resource_id(uint32_t resource_id);

// {"id", "name", "kind", "value"}; nested values for arrays and maps
nlohmann::json resource_to_json(const Resource& resource);

// Non-default fields only, plus "qualifiers"
nlohmann::json config_to_json(const ResTableConfig& config);

nlohmann::json type_to_json(const Type& type);

nlohmann::json package_to_json(const Package& package);

// {"packages": [...], "string_pool_size": n}
nlohmann::json table_to_json(const ResourceTable& table);

nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings);

nlohmann::json parse_error_to_json(const ParseError& error);

} // namespace arsc
