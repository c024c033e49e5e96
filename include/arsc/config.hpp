#pragma once

#include "arsc/decode_context.hpp"
#include "arsc/types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace arsc {

// ============================================================================
// ResTable_config
// ============================================================================

// Device configuration a set of resource values applies to. The record grows over
// platform releases; size says which tail fields were present.
struct ResTableConfig {
    uint32_t size = 0;
    uint16_t mcc = 0;
    uint16_t mnc = 0;
    std::array<char, 2> language{};
    std::array<char, 2> country{};

    uint8_t orientation = 0;
    uint8_t touchscreen = 0;
    uint16_t density = 0;

    uint8_t keyboard = 0;
    uint8_t navigation = 0;
    uint8_t input_flags = 0;
    uint8_t input_pad0 = 0;

    uint16_t screen_width = 0;
    uint16_t screen_height = 0;

    uint16_t sdk_version = 0;
    uint16_t minor_version = 0;

    // size > 28
    uint8_t screen_layout = 0;
    uint8_t ui_mode = 0;
    uint16_t smallest_screen_width_dp = 0;

    // size > 32
    uint16_t screen_width_dp = 0;
    uint16_t screen_height_dp = 0;

    // size > 36
    std::array<char, 4> locale_script{};

    // size > 40
    std::array<char, 8> locale_variant{};

    std::string language_string() const;
    std::string country_string() const;
    std::string locale_script_string() const;
    std::string locale_variant_string() const;

    // Qualifier string such as "en-rUS-sw600dp-land-hdpi-v21"; empty for the default config
    std::string to_string() const;

    bool operator==(const ResTableConfig& other) const;
    bool operator!=(const ResTableConfig& other) const { return !(*this == other); }
};

constexpr size_t CONFIG_BASE_SIZE = 28;
constexpr size_t CONFIG_KNOWN_SIZE = 48;

struct ConfigDecodeResult {
    bool ok = false;
    ParseError error;
    ResTableConfig config;
    size_t next = 0;  // offset after the last consumed byte
};

ConfigDecodeResult decode_config(const std::vector<uint8_t>& data, size_t offset, DecodeContext& ctx);

} // namespace arsc
