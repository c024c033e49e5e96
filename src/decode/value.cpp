#include "arsc/value.hpp"

#include "arsc/byte_reader.hpp"

#include <cstring>

namespace arsc {

namespace {

constexpr float MANTISSA_MULT = 1.0f / (1 << COMPLEX_MANTISSA_SHIFT);
constexpr float RADIX_MULTS[] = {
    1.0f * MANTISSA_MULT,
    1.0f / (1 << 7) * MANTISSA_MULT,
    1.0f / (1 << 15) * MANTISSA_MULT,
    1.0f / (1 << 23) * MANTISSA_MULT,
};

std::optional<DimensionUnit> dimension_unit(uint32_t unit) {
    switch (unit) {
        case COMPLEX_UNIT_PX: return DimensionUnit::PX;
        case COMPLEX_UNIT_DIP: return DimensionUnit::DIP;
        case COMPLEX_UNIT_SP: return DimensionUnit::SP;
        case COMPLEX_UNIT_PT: return DimensionUnit::PT;
        case COMPLEX_UNIT_IN: return DimensionUnit::IN;
        case COMPLEX_UNIT_MM: return DimensionUnit::MM;
        default: return std::nullopt;
    }
}

float bits_to_float(uint32_t bits) {
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

} // namespace

bool is_attribute_map_name(uint32_t name) {
    return name == ATTR_TYPE || name == ATTR_MIN || name == ATTR_MAX || name == ATTR_L10N ||
           name == ATTR_OTHER || name == ATTR_ZERO || name == ATTR_ONE || name == ATTR_TWO ||
           name == ATTR_FEW || name == ATTR_MANY;
}

RawValueDecodeResult decode_raw_value(const std::vector<uint8_t>& data, size_t offset,
                                      const std::string& resource_name, DecodeContext& ctx) {
    RawValueDecodeResult result;
    result.ok = true;

    if (!has_bytes(data, offset, RES_VALUE_SIZE)) {
        ctx.warnings.emit(Warning::malformed_value,
                          warnings::malformed_value(resource_name, "value out of bounds", offset));
        result.malformed = true;
        return result;
    }

    auto size = read_u16(data, offset);
    result.value.size = size->value;
    if (result.value.size > RES_VALUE_SIZE) {
        // Always 8 in practice; larger values come from broken resource compilers
        ctx.warnings.emit(Warning::malformed_value,
                          warnings::malformed_value(resource_name,
                                                    "value size " + std::to_string(result.value.size),
                                                    offset));
        result.malformed = true;
        return result;
    }

    auto res0 = read_u8(data, size->next);
    result.value.res0 = res0->value;
    if (result.value.res0 != 0 &&
        !ctx.format_violation("File format violation: res0 is not zero", size->next, result.error)) {
        result.ok = false;
        return result;
    }

    auto data_type = read_u8(data, res0->next);
    result.value.data_type = data_type->value;

    auto value = read_u32(data, data_type->next);
    result.value.data = value->value;
    result.next = value->next;
    return result;
}

float complex_to_float(uint32_t complex) {
    int32_t mantissa = static_cast<int32_t>(complex & (COMPLEX_MANTISSA_MASK << COMPLEX_MANTISSA_SHIFT));
    return static_cast<float>(mantissa) *
           RADIX_MULTS[(complex >> COMPLEX_RADIX_SHIFT) & COMPLEX_RADIX_MASK];
}

ColorValue decode_color(uint32_t data) {
    // 0xFF000000 >> 24 sign-extends to an all-ones mask
    ColorValue color;
    color.a = static_cast<int32_t>(data & 0xFFFFFFFFu);
    color.r = static_cast<int32_t>(data & (0x00FF0000u >> 16));
    color.g = static_cast<int32_t>(data & (0x0000FF00u >> 8));
    color.b = static_cast<int32_t>(data & 0x000000FFu);
    return color;
}

std::optional<ResourceValue> decode_value(const RawValue& raw, const StringPool& global_pool,
                                          const std::string& resource_name, DecodeContext& ctx) {
    switch (raw.data_type) {
        case TYPE_NULL:
            return ResourceValue{NullValue{}};
        case TYPE_REFERENCE:
            return ResourceValue{ReferenceValue{raw.data}};
        case TYPE_ATTRIBUTE:
            return ResourceValue{AttributeValue{raw.data}};
        case TYPE_STRING: {
            const std::string* text = global_pool.find(raw.data);
            if (!text) {
                ctx.warnings.emit(Warning::missing_string, warnings::missing_string("global", raw.data));
                return ResourceValue{StringValue{}};
            }
            return ResourceValue{StringValue{*text}};
        }
        case TYPE_INT_DEC:
        case TYPE_INT_HEX:
            return ResourceValue{IntegerValue{static_cast<int32_t>(raw.data)}};
        case TYPE_INT_BOOLEAN:
            return ResourceValue{BooleanValue{raw.data != 0}};
        case TYPE_INT_COLOR_ARGB8:
        case TYPE_INT_COLOR_RGB8:
        case TYPE_INT_COLOR_ARGB4:
        case TYPE_INT_COLOR_RGB4:
            return ResourceValue{decode_color(raw.data)};
        case TYPE_DIMENSION: {
            uint32_t unit = (raw.data >> COMPLEX_UNIT_SHIFT) & COMPLEX_UNIT_MASK;
            auto parsed = dimension_unit(unit);
            if (!parsed) {
                ctx.warnings.emit(Warning::invalid_dimension_unit,
                                  warnings::invalid_dimension_unit(resource_name, unit));
                return std::nullopt;
            }
            return ResourceValue{DimensionValue{complex_to_float(raw.data), *parsed}};
        }
        case TYPE_FLOAT:
            return ResourceValue{FloatValue{bits_to_float(raw.data)}};
        case TYPE_FRACTION: {
            uint32_t fraction_type = (raw.data >> COMPLEX_UNIT_SHIFT) & COMPLEX_UNIT_MASK;
            FractionType type = fraction_type == COMPLEX_UNIT_FRACTION ? FractionType::Fraction
                                                                       : FractionType::FractionParent;
            return ResourceValue{FractionValue{type, complex_to_float(raw.data)}};
        }
        default:
            ctx.warnings.emit(Warning::unknown_data_type,
                              warnings::unknown_data_type(resource_name, raw.data_type));
            return std::nullopt;
    }
}

void add_map_record(ComplexMapValue& map, const std::string& type_name, uint32_t name,
                    ResourceValue value) {
    const std::string map_name = std::to_string(name);

    if (type_name == "array" && std::holds_alternative<StringValue>(value)) {
        Resource* existing = map.find(map_name);
        if (!existing) {
            Resource array;
            array.name.clear();
            array.value = ArrayValue{};
            map.entries.push_back(MapEntry{map_name, std::move(array)});
            existing = &map.entries.back().value;
        }

        // A key already holding a non-array value keeps it
        if (auto* array = existing->as<ArrayValue>()) {
            Resource element;
            element.name.clear();
            element.value = std::move(value);
            array->elements.push_back(std::move(element));
        }
        return;
    }

    Resource record;
    record.name.clear();
    record.value = std::move(value);
    map.set(map_name, std::move(record));
}

ComplexDecodeResult decode_complex_entry(const std::vector<uint8_t>& data, size_t offset,
                                         uint32_t count, const std::string& type_name,
                                         const StringPool& global_pool,
                                         const std::string& resource_name, DecodeContext& ctx) {
    ComplexDecodeResult result;
    result.ok = true;
    result.value.res_type = type_name;

    for (uint32_t i = 0; i < count; ++i) {
        auto name = read_u32(data, offset);
        if (!name) {
            ctx.warnings.emit(Warning::malformed_value,
                              warnings::malformed_value(resource_name, "map record out of bounds", offset));
            result.skipped = true;
            return result;
        }

        auto raw = decode_raw_value(data, name->next, resource_name, ctx);
        if (!raw.ok) {
            result.ok = false;
            result.error = raw.error;
            return result;
        }
        if (raw.malformed) {
            result.skipped = true;
            return result;
        }
        offset = raw.next;

        auto value = decode_value(raw.value, global_pool, resource_name, ctx);
        if (!value) continue;

        add_map_record(result.value, type_name, name->value, std::move(*value));
    }

    return result;
}

} // namespace arsc
