#pragma once

#include "arsc/types.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace arsc {

// ============================================================================
// Resource Ids
// ============================================================================

// 0xPPTTEEEE: package, type, entry index
struct ResourceId {
    uint32_t package_id = 0;
    uint32_t type_id = 0;
    uint32_t item_index = 0;

    // "Package 127, type 1, item 0"
    std::string to_string() const;

    bool operator==(const ResourceId& other) const {
        return package_id == other.package_id && type_id == other.type_id &&
               item_index == other.item_index;
    }
};

inline uint32_t make_resource_id(uint32_t package_id, uint32_t type_id, uint32_t item_index) {
    return ((package_id & 0xFF) << 24) | ((type_id & 0xFF) << 16) | (item_index & 0xFFFF);
}

inline ResourceId parse_resource_id(uint32_t resource_id) {
    return ResourceId{(resource_id & 0xFF000000) >> 24, (resource_id & 0x00FF0000) >> 16,
                      resource_id & 0x0000FFFF};
}

// ============================================================================
// Resource Values
// ============================================================================

enum class DimensionUnit { PX, DIP, SP, PT, IN, MM };

const char* dimension_unit_to_string(DimensionUnit unit);

enum class FractionType {
    Fraction,        // fraction of the overall size
    FractionParent,  // fraction of the parent size
};

struct Resource;
struct MapEntry;

struct NullValue {};

struct ReferenceValue {
    uint32_t reference_id = 0;
};

struct AttributeValue {
    uint32_t attribute_id = 0;
};

struct StringValue {
    std::string value;
};

struct IntegerValue {
    int32_t value = 0;
};

struct FloatValue {
    float value = 0.0f;
};

struct BooleanValue {
    bool value = false;
};

struct ColorValue {
    int32_t a = 0;
    int32_t r = 0;
    int32_t g = 0;
    int32_t b = 0;

    uint32_t argb() const;
};

struct DimensionValue {
    float value = 0.0f;
    DimensionUnit unit = DimensionUnit::PX;
};

struct FractionValue {
    FractionType type = FractionType::Fraction;
    float value = 0.0f;
};

struct ArrayValue {
    std::vector<Resource> elements;
};

// name -> value records of a map entry, kept in encounter order
struct ComplexMapValue {
    std::string res_type;
    std::vector<MapEntry> entries;

    const Resource* find(const std::string& name) const;
    Resource* find(const std::string& name);

    // Replaces an existing record with the same name
    void set(const std::string& name, Resource value);
};

using ResourceValue = std::variant<NullValue, ReferenceValue, AttributeValue, StringValue,
                                   IntegerValue, FloatValue, BooleanValue, ColorValue,
                                   DimensionValue, FractionValue, ArrayValue, ComplexMapValue>;

// ============================================================================
// Resource
// ============================================================================

struct Resource {
    std::string name = INVALID_RESOURCE_NAME;
    uint32_t id = 0;
    ResourceValue value;

    template <typename T>
    bool is() const { return std::holds_alternative<T>(value); }

    template <typename T>
    const T* as() const { return std::get_if<T>(&value); }

    template <typename T>
    T* as() { return std::get_if<T>(&value); }

    // Variant tag, e.g. "string", "dimension", "complex"
    const char* kind() const;

    // Human-readable rendering of the value
    std::string to_string() const;
};

struct MapEntry {
    std::string name;
    Resource value;
};

bool operator==(const Resource& a, const Resource& b);
inline bool operator!=(const Resource& a, const Resource& b) { return !(a == b); }

} // namespace arsc
