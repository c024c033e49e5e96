#include "arsc/resource.hpp"

#include <cstdio>
#include <cstring>
#include <type_traits>

namespace arsc {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Compares float bit patterns so NaN payloads compare equal to themselves
bool same_bits(float a, float b) {
    uint32_t ua = 0;
    uint32_t ub = 0;
    std::memcpy(&ua, &a, sizeof(ua));
    std::memcpy(&ub, &b, sizeof(ub));
    return ua == ub;
}

std::string hex_id(uint32_t id) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%08x", id);
    return buffer;
}

std::string format_float(float value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%g", static_cast<double>(value));
    return buffer;
}

bool values_equal(const ResourceValue& a, const ResourceValue& b);

bool entries_equal(const std::vector<MapEntry>& a, const std::vector<MapEntry>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].name != b[i].name || a[i].value != b[i].value) return false;
    }
    return true;
}

bool values_equal(const ResourceValue& a, const ResourceValue& b) {
    if (a.index() != b.index()) return false;
    return std::visit(
        [&b](const auto& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            const T& rhs = std::get<T>(b);
            if constexpr (std::is_same_v<T, NullValue>) {
                return true;
            } else if constexpr (std::is_same_v<T, ReferenceValue>) {
                return lhs.reference_id == rhs.reference_id;
            } else if constexpr (std::is_same_v<T, AttributeValue>) {
                return lhs.attribute_id == rhs.attribute_id;
            } else if constexpr (std::is_same_v<T, StringValue> || std::is_same_v<T, IntegerValue> ||
                                 std::is_same_v<T, BooleanValue>) {
                return lhs.value == rhs.value;
            } else if constexpr (std::is_same_v<T, FloatValue>) {
                return same_bits(lhs.value, rhs.value);
            } else if constexpr (std::is_same_v<T, ColorValue>) {
                return lhs.a == rhs.a && lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
            } else if constexpr (std::is_same_v<T, DimensionValue>) {
                return lhs.unit == rhs.unit && same_bits(lhs.value, rhs.value);
            } else if constexpr (std::is_same_v<T, FractionValue>) {
                return lhs.type == rhs.type && same_bits(lhs.value, rhs.value);
            } else if constexpr (std::is_same_v<T, ArrayValue>) {
                return lhs.elements == rhs.elements;
            } else {
                return lhs.res_type == rhs.res_type && entries_equal(lhs.entries, rhs.entries);
            }
        },
        a);
}

} // namespace

std::string ResourceId::to_string() const {
    return "Package " + std::to_string(package_id) + ", type " + std::to_string(type_id) +
           ", item " + std::to_string(item_index);
}

const char* dimension_unit_to_string(DimensionUnit unit) {
    switch (unit) {
        case DimensionUnit::PX: return "px";
        case DimensionUnit::DIP: return "dip";
        case DimensionUnit::SP: return "sp";
        case DimensionUnit::PT: return "pt";
        case DimensionUnit::IN: return "in";
        case DimensionUnit::MM: return "mm";
        default: return "px";
    }
}

uint32_t ColorValue::argb() const {
    return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(r) << 16) |
           (static_cast<uint32_t>(g) << 8) | static_cast<uint32_t>(b);
}

const Resource* ComplexMapValue::find(const std::string& name) const {
    for (const auto& entry : entries) {
        if (entry.name == name) return &entry.value;
    }
    return nullptr;
}

Resource* ComplexMapValue::find(const std::string& name) {
    for (auto& entry : entries) {
        if (entry.name == name) return &entry.value;
    }
    return nullptr;
}

void ComplexMapValue::set(const std::string& name, Resource value) {
    if (Resource* existing = find(name)) {
        *existing = std::move(value);
        return;
    }
    entries.push_back(MapEntry{name, std::move(value)});
}

const char* Resource::kind() const {
    return std::visit(
        overloaded{
            [](const NullValue&) { return "null"; },
            [](const ReferenceValue&) { return "reference"; },
            [](const AttributeValue&) { return "attribute"; },
            [](const StringValue&) { return "string"; },
            [](const IntegerValue&) { return "integer"; },
            [](const FloatValue&) { return "float"; },
            [](const BooleanValue&) { return "boolean"; },
            [](const ColorValue&) { return "color"; },
            [](const DimensionValue&) { return "dimension"; },
            [](const FractionValue&) { return "fraction"; },
            [](const ArrayValue&) { return "array"; },
            [](const ComplexMapValue&) { return "complex"; },
        },
        value);
}

std::string Resource::to_string() const {
    return std::visit(
        overloaded{
            [](const NullValue&) -> std::string { return "null"; },
            [](const ReferenceValue& v) -> std::string { return "@" + hex_id(v.reference_id); },
            [](const AttributeValue& v) -> std::string { return "?" + hex_id(v.attribute_id); },
            [](const StringValue& v) -> std::string { return v.value; },
            [](const IntegerValue& v) -> std::string { return std::to_string(v.value); },
            [](const FloatValue& v) -> std::string { return format_float(v.value); },
            [](const BooleanValue& v) -> std::string { return v.value ? "true" : "false"; },
            [](const ColorValue& v) -> std::string {
                char buffer[48];
                std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x%02x",
                              static_cast<unsigned>(v.a), static_cast<unsigned>(v.r),
                              static_cast<unsigned>(v.g), static_cast<unsigned>(v.b));
                return buffer;
            },
            [](const DimensionValue& v) -> std::string {
                return format_float(v.value) + dimension_unit_to_string(v.unit);
            },
            [](const FractionValue& v) -> std::string {
                return format_float(v.value * 100.0f) +
                       (v.type == FractionType::FractionParent ? "%p" : "%");
            },
            [](const ArrayValue& v) -> std::string {
                std::string out = "[";
                for (size_t i = 0; i < v.elements.size(); ++i) {
                    if (i > 0) out += ", ";
                    out += v.elements[i].to_string();
                }
                return out + "]";
            },
            [](const ComplexMapValue& v) -> std::string {
                std::string out = "{";
                for (size_t i = 0; i < v.entries.size(); ++i) {
                    if (i > 0) out += ", ";
                    out += v.entries[i].name + "=" + v.entries[i].value.to_string();
                }
                return out + "}";
            },
        },
        value);
}

bool operator==(const Resource& a, const Resource& b) {
    return a.name == b.name && a.id == b.id && values_equal(a.value, b.value);
}

} // namespace arsc
