#include "arsc/string_pool.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace arsc {

namespace {

constexpr size_t STRING_POOL_HEADER_SIZE = 28;

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// UTF-16 form: u16 character count, then that many code units
bool read_utf16_string(const std::vector<uint8_t>& data, size_t offset, std::string& out) {
    auto length = read_u16(data, offset);
    if (!length) return false;
    if (length->value == 0) {
        out.clear();
        return true;
    }

    size_t pos = length->next;
    if (!has_bytes(data, pos, static_cast<size_t>(length->value) * 2)) return false;

    std::vector<uint16_t> units;
    units.reserve(length->value);
    for (uint16_t i = 0; i < length->value; ++i) {
        auto unit = read_u16(data, pos);
        units.push_back(unit->value);
        pos = unit->next;
    }
    out = utf16_to_utf8(units);
    return true;
}

// UTF-8 form: the first byte is the UTF-16 length and is skipped; the second byte is
// taken as the byte length. Longer strings use a two-byte length that is not decoded here.
bool read_utf8_string(const std::vector<uint8_t>& data, size_t offset, std::string& out) {
    auto length = read_u8(data, offset + 1);
    if (!length) return false;
    size_t pos = offset + 2;
    if (!has_bytes(data, pos, length->value)) return false;
    out = sanitize_utf8(data.data() + pos, length->value);
    return true;
}

} // namespace

// ============================================================================
// StringPool
// ============================================================================

const std::string* StringPool::find(uint32_t index) const {
    auto it = strings_.find(index);
    if (it == strings_.end()) return nullptr;
    return &it->second;
}

void StringPool::put(uint32_t index, std::string value) {
    strings_[index] = std::move(value);
}

void StringPool::merge(const StringPool& other) {
    for (const auto& [index, value] : other.strings_) {
        strings_[index] = value;
    }
}

std::vector<std::pair<uint32_t, std::string>> StringPool::entries() const {
    std::vector<std::pair<uint32_t, std::string>> result(strings_.begin(), strings_.end());
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return result;
}

// ============================================================================
// Decoding
// ============================================================================

std::string utf16_to_utf8(const std::vector<uint16_t>& units) {
    std::string out;
    out.reserve(units.size());
    for (size_t i = 0; i < units.size(); ++i) {
        uint32_t unit = units[i];
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 1 < units.size() && units[i + 1] >= 0xDC00 && units[i + 1] <= 0xDFFF) {
                uint32_t low = units[++i];
                append_utf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
            } else {
                append_utf8(out, 0xFFFD);
            }
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            append_utf8(out, 0xFFFD);
        } else {
            append_utf8(out, unit);
        }
    }
    return out;
}

std::string sanitize_utf8(const uint8_t* bytes, size_t size) {
    std::string out;
    out.reserve(size);
    size_t i = 0;
    while (i < size) {
        uint8_t lead = bytes[i];
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        size_t length = 0;
        uint32_t cp = 0;
        uint32_t min = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
            min = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
            min = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
            min = 0x10000;
        } else {
            // Stray continuation byte or invalid lead
            append_utf8(out, 0xFFFD);
            ++i;
            continue;
        }

        size_t n = 1;
        while (n < length && i + n < size && (bytes[i + n] & 0xC0) == 0x80) {
            cp = (cp << 6) | (bytes[i + n] & 0x3F);
            ++n;
        }

        if (n < length) {
            // Truncated sequence: one replacement for the bytes consumed
            append_utf8(out, 0xFFFD);
            i += n;
        } else if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            // Overlong, out of range or surrogate: the continuation bytes are replaced on their own
            append_utf8(out, 0xFFFD);
            ++i;
        } else {
            out.append(reinterpret_cast<const char*>(bytes + i), length);
            i += length;
        }
    }
    return out;
}

std::string trim_control(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && static_cast<unsigned char>(s[start]) <= 0x20) ++start;
    size_t end = s.size();
    while (end > start && static_cast<unsigned char>(s[end - 1]) <= 0x20) --end;
    return s.substr(start, end - start);
}

bool decode_string_pool_into(const std::vector<uint8_t>& data, size_t chunk_start,
                             StringPool& pool, ParseError& error) {
    auto result = decode_string_pool(data, chunk_start);
    if (!result.ok) {
        error = result.error;
        return false;
    }
    pool.merge(result.pool);
    return true;
}

StringPoolDecodeResult decode_string_pool(const std::vector<uint8_t>& data, size_t chunk_start) {
    StringPoolDecodeResult result;

    auto chunk = read_chunk_header(data, chunk_start);
    if (!chunk) {
        result.error = make_error(ErrorKind::Truncated, "string pool header out of bounds", chunk_start);
        return result;
    }
    if (chunk->value.type != RES_STRING_POOL_TYPE) {
        result.error = make_error(ErrorKind::StructuralInconsistency,
                                  "expected string pool chunk", chunk_start);
        return result;
    }
    if (chunk->value.header_size < STRING_POOL_HEADER_SIZE ||
        !has_bytes(data, chunk_start, STRING_POOL_HEADER_SIZE)) {
        result.error = make_error(ErrorKind::Truncated, "string pool header too small", chunk_start);
        return result;
    }

    StringPoolHeader& header = result.header;
    header.chunk = chunk->value;
    size_t offset = chunk->next;
    header.string_count = read_u32(data, offset)->value;
    header.style_count = read_u32(data, offset + 4)->value;
    uint32_t flags = read_u32(data, offset + 8)->value;
    header.sorted = (flags & SORTED_FLAG) == SORTED_FLAG;
    header.utf8 = (flags & UTF8_FLAG) == UTF8_FLAG;
    header.strings_start = read_u32(data, offset + 12)->value;
    header.styles_start = read_u32(data, offset + 16)->value;

    offset = chunk_start + header.chunk.header_size;
    for (uint32_t i = 0; i < header.string_count; ++i) {
        auto string_offset = read_u32(data, offset);
        if (!string_offset) {
            result.error = make_error(ErrorKind::Truncated, "string offset table out of bounds", offset);
            return result;
        }
        offset = string_offset->next;

        size_t position = chunk_start + header.strings_start + string_offset->value;
        std::string value;
        bool read_ok = header.utf8 ? read_utf8_string(data, position, value)
                                   : read_utf16_string(data, position, value);
        if (!read_ok) {
            result.error = make_error(ErrorKind::Truncated, "string data out of bounds", position);
            return result;
        }
        result.pool.put(i, trim_control(value));
    }

    spdlog::trace("string pool at 0x{:x}: {} strings, utf8={}", chunk_start,
                  header.string_count, header.utf8);
    result.ok = true;
    return result;
}

} // namespace arsc
