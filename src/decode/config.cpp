#include "arsc/config.hpp"

#include "arsc/byte_reader.hpp"

namespace arsc {

namespace {

template <size_t N>
std::string chars_to_string(const std::array<char, N>& chars) {
    std::string out;
    for (char c : chars) {
        if (c == '\0') break;
        out += c;
    }
    return out;
}

template <size_t N>
size_t read_chars(const std::vector<uint8_t>& data, size_t offset, std::array<char, N>& out) {
    for (size_t i = 0; i < N; ++i) {
        out[i] = static_cast<char>(data[offset + i]);
    }
    return offset + N;
}

// Fixed-width reads for a region already checked with has_bytes
uint8_t u8_at(const std::vector<uint8_t>& data, size_t& offset) {
    auto r = read_u8(data, offset);
    offset = r->next;
    return r->value;
}

uint16_t u16_at(const std::vector<uint8_t>& data, size_t& offset) {
    auto r = read_u16(data, offset);
    offset = r->next;
    return r->value;
}

uint32_t u32_at(const std::vector<uint8_t>& data, size_t& offset) {
    auto r = read_u32(data, offset);
    offset = r->next;
    return r->value;
}

const char* density_qualifier(uint16_t density) {
    switch (density) {
        case 120: return "ldpi";
        case 160: return "mdpi";
        case 213: return "tvdpi";
        case 240: return "hdpi";
        case 320: return "xhdpi";
        case 480: return "xxhdpi";
        case 640: return "xxxhdpi";
        case 0xfffe: return "anydpi";
        case 0xffff: return "nodpi";
        default: return nullptr;
    }
}

void append_qualifier(std::string& out, const std::string& qualifier) {
    if (!out.empty()) out += "-";
    out += qualifier;
}

ConfigDecodeResult truncated(size_t offset) {
    ConfigDecodeResult result;
    result.error = make_error(ErrorKind::Truncated, "config record out of bounds", offset);
    return result;
}

} // namespace

std::string ResTableConfig::language_string() const { return chars_to_string(language); }
std::string ResTableConfig::country_string() const { return chars_to_string(country); }
std::string ResTableConfig::locale_script_string() const { return chars_to_string(locale_script); }
std::string ResTableConfig::locale_variant_string() const { return chars_to_string(locale_variant); }

std::string ResTableConfig::to_string() const {
    std::string res;

    if (mcc != 0) append_qualifier(res, "mcc" + std::to_string(mcc));
    if (mnc != 0) append_qualifier(res, "mnc" + std::to_string(mnc));

    std::string lang = language_string();
    if (!lang.empty()) {
        append_qualifier(res, lang);
        std::string region = country_string();
        if (!region.empty()) res += "-r" + region;
    }

    if (smallest_screen_width_dp != 0) {
        append_qualifier(res, "sw" + std::to_string(smallest_screen_width_dp) + "dp");
    }
    if (screen_width_dp != 0) append_qualifier(res, "w" + std::to_string(screen_width_dp) + "dp");
    if (screen_height_dp != 0) append_qualifier(res, "h" + std::to_string(screen_height_dp) + "dp");

    switch (orientation) {
        case 0: break;
        case 1: append_qualifier(res, "port"); break;
        case 2: append_qualifier(res, "land"); break;
        case 3: append_qualifier(res, "square"); break;
        default: append_qualifier(res, "orientation=" + std::to_string(orientation)); break;
    }

    if (density != 0) {
        const char* name = density_qualifier(density);
        append_qualifier(res, name ? std::string(name) : std::to_string(density) + "dpi");
    }

    if (screen_width != 0 || screen_height != 0) {
        append_qualifier(res, std::to_string(screen_width) + "x" + std::to_string(screen_height));
    }

    if (sdk_version != 0) {
        std::string version = "v" + std::to_string(sdk_version);
        if (minor_version != 0) version += "." + std::to_string(minor_version);
        append_qualifier(res, version);
    }

    return res;
}

bool ResTableConfig::operator==(const ResTableConfig& other) const {
    return size == other.size && mcc == other.mcc && mnc == other.mnc &&
           language == other.language && country == other.country &&
           orientation == other.orientation && touchscreen == other.touchscreen &&
           density == other.density && keyboard == other.keyboard &&
           navigation == other.navigation && input_flags == other.input_flags &&
           input_pad0 == other.input_pad0 && screen_width == other.screen_width &&
           screen_height == other.screen_height && sdk_version == other.sdk_version &&
           minor_version == other.minor_version && screen_layout == other.screen_layout &&
           ui_mode == other.ui_mode &&
           smallest_screen_width_dp == other.smallest_screen_width_dp &&
           screen_width_dp == other.screen_width_dp &&
           screen_height_dp == other.screen_height_dp &&
           locale_script == other.locale_script && locale_variant == other.locale_variant;
}

ConfigDecodeResult decode_config(const std::vector<uint8_t>& data, size_t offset, DecodeContext& ctx) {
    ConfigDecodeResult result;
    ResTableConfig& config = result.config;

    // The 28-byte base record is always present
    if (!has_bytes(data, offset, CONFIG_BASE_SIZE)) return truncated(offset);

    config.size = u32_at(data, offset);
    config.mcc = u16_at(data, offset);
    config.mnc = u16_at(data, offset);
    offset = read_chars(data, offset, config.language);
    offset = read_chars(data, offset, config.country);

    config.orientation = u8_at(data, offset);
    config.touchscreen = u8_at(data, offset);
    config.density = u16_at(data, offset);

    config.keyboard = u8_at(data, offset);
    config.navigation = u8_at(data, offset);
    config.input_flags = u8_at(data, offset);
    config.input_pad0 = u8_at(data, offset);

    config.screen_width = u16_at(data, offset);
    config.screen_height = u16_at(data, offset);

    config.sdk_version = u16_at(data, offset);
    config.minor_version = u16_at(data, offset);

    result.ok = true;
    result.next = offset;
    if (config.size <= 28) return result;

    if (!has_bytes(data, offset, 4)) return truncated(offset);
    config.screen_layout = u8_at(data, offset);
    config.ui_mode = u8_at(data, offset);
    config.smallest_screen_width_dp = u16_at(data, offset);
    result.next = offset;
    if (config.size <= 32) return result;

    if (!has_bytes(data, offset, 4)) return truncated(offset);
    config.screen_width_dp = u16_at(data, offset);
    config.screen_height_dp = u16_at(data, offset);
    result.next = offset;
    if (config.size <= 36) return result;

    if (!has_bytes(data, offset, 4)) return truncated(offset);
    offset = read_chars(data, offset, config.locale_script);
    result.next = offset;
    if (config.size <= 40) return result;

    if (!has_bytes(data, offset, 8)) return truncated(offset);
    offset = read_chars(data, offset, config.locale_variant);
    result.next = offset;
    if (config.size <= CONFIG_KNOWN_SIZE) return result;

    // Fields added by newer platforms are not interpreted. All-zero is expected.
    uint32_t remaining = config.size - static_cast<uint32_t>(CONFIG_KNOWN_SIZE);
    if (!has_bytes(data, offset, remaining)) return truncated(offset);
    bool all_zero = true;
    for (uint32_t i = 0; i < remaining; ++i) {
        if (data[offset + i] != 0) {
            all_zero = false;
            break;
        }
    }
    if (!all_zero) {
        ctx.warnings.emit(Warning::config_trailing_bytes, warnings::config_trailing_bytes(remaining));
    }
    result.next = offset + remaining;
    return result;
}

} // namespace arsc
