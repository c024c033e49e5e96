#pragma once

#include "arsc/decode_context.hpp"
#include "arsc/resource.hpp"
#include "arsc/string_pool.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arsc {

// ============================================================================
// Res_value data types
// ============================================================================

enum DataType : uint8_t {
    TYPE_NULL = 0x00,
    TYPE_REFERENCE = 0x01,
    TYPE_ATTRIBUTE = 0x02,
    TYPE_STRING = 0x03,
    TYPE_FLOAT = 0x04,
    TYPE_DIMENSION = 0x05,
    TYPE_FRACTION = 0x06,
    TYPE_INT_DEC = 0x10,
    TYPE_INT_HEX = 0x11,
    TYPE_INT_BOOLEAN = 0x12,
    TYPE_INT_COLOR_ARGB8 = 0x1c,
    TYPE_INT_COLOR_RGB8 = 0x1d,
    TYPE_INT_COLOR_ARGB4 = 0x1e,
    TYPE_INT_COLOR_RGB4 = 0x1f,
};

// Complex (fixed-point) encoding used by dimensions and fractions
constexpr uint32_t COMPLEX_UNIT_SHIFT = 0;
constexpr uint32_t COMPLEX_UNIT_MASK = 0xf;
constexpr uint32_t COMPLEX_UNIT_PX = 0;
constexpr uint32_t COMPLEX_UNIT_DIP = 1;
constexpr uint32_t COMPLEX_UNIT_SP = 2;
constexpr uint32_t COMPLEX_UNIT_PT = 3;
constexpr uint32_t COMPLEX_UNIT_IN = 4;
constexpr uint32_t COMPLEX_UNIT_MM = 5;
constexpr uint32_t COMPLEX_UNIT_FRACTION = 0;
constexpr uint32_t COMPLEX_UNIT_FRACTION_PARENT = 1;
constexpr uint32_t COMPLEX_RADIX_SHIFT = 4;
constexpr uint32_t COMPLEX_RADIX_MASK = 0x3;
constexpr uint32_t COMPLEX_RADIX_23p0 = 0;
constexpr uint32_t COMPLEX_RADIX_16p7 = 1;
constexpr uint32_t COMPLEX_RADIX_8p15 = 2;
constexpr uint32_t COMPLEX_RADIX_0p23 = 3;
constexpr uint32_t COMPLEX_MANTISSA_SHIFT = 8;
constexpr uint32_t COMPLEX_MANTISSA_MASK = 0xffffff;

// Map names with a fixed meaning for attribute resources
constexpr uint32_t ATTR_TYPE = 0x01000000 | 0;
constexpr uint32_t ATTR_MIN = 0x01000000 | 1;
constexpr uint32_t ATTR_MAX = 0x01000000 | 2;
constexpr uint32_t ATTR_L10N = 0x01000000 | 3;
constexpr uint32_t ATTR_OTHER = 0x01000000 | 4;
constexpr uint32_t ATTR_ZERO = 0x01000000 | 5;
constexpr uint32_t ATTR_ONE = 0x01000000 | 6;
constexpr uint32_t ATTR_TWO = 0x01000000 | 7;
constexpr uint32_t ATTR_FEW = 0x01000000 | 8;
constexpr uint32_t ATTR_MANY = 0x01000000 | 9;

bool is_attribute_map_name(uint32_t name);

// ============================================================================
// Res_value
// ============================================================================

constexpr size_t RES_VALUE_SIZE = 8;

struct RawValue {
    uint16_t size = 0;
    uint8_t res0 = 0;
    uint8_t data_type = 0;
    uint32_t data = 0;
};

struct RawValueDecodeResult {
    bool ok = false;          // false: fatal, see error
    ParseError error;
    bool malformed = false;   // size > 8: the owning entry must be skipped
    RawValue value;
    size_t next = 0;
};

// A malformed record is reported against resource_name.
RawValueDecodeResult decode_raw_value(const std::vector<uint8_t>& data, size_t offset,
                                      const std::string& resource_name, DecodeContext& ctx);

// (mantissa & 0xffffff00) scaled by the radix selected by bits 4..5
float complex_to_float(uint32_t complex);

// Channel extraction for the four packed color forms. The masks are applied to
// pre-shifted constants, so a holds the whole word and r, g and b its low byte.
ColorValue decode_color(uint32_t data);

// Maps a raw value to a resource variant. std::nullopt when the value cannot be
// represented; a warning naming resource_name has then been emitted.
std::optional<ResourceValue> decode_value(const RawValue& raw, const StringPool& global_pool,
                                          const std::string& resource_name, DecodeContext& ctx);

// ============================================================================
// Complex (map) entries
// ============================================================================

// Stores one decoded map record. In a type named "array", String values are appended
// to the Array kept under the record name instead of replacing it.
void add_map_record(ComplexMapValue& map, const std::string& type_name, uint32_t name,
                    ResourceValue value);

struct ComplexDecodeResult {
    bool ok = false;          // false: fatal, see error
    ParseError error;
    bool skipped = false;     // a malformed record invalidated the entry
    ComplexMapValue value;
};

// Reads count ResTable_map records (name u32 + Res_value) starting at offset.
ComplexDecodeResult decode_complex_entry(const std::vector<uint8_t>& data, size_t offset,
                                         uint32_t count, const std::string& type_name,
                                         const StringPool& global_pool,
                                         const std::string& resource_name, DecodeContext& ctx);

} // namespace arsc
