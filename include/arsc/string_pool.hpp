#pragma once

#include "arsc/byte_reader.hpp"
#include "arsc/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace arsc {

// ============================================================================
// ResStringPool_header
// ============================================================================

struct StringPoolHeader {
    ChunkHeader chunk;
    uint32_t string_count = 0;
    uint32_t style_count = 0;
    bool sorted = false;
    bool utf8 = false;
    uint32_t strings_start = 0;
    uint32_t styles_start = 0;
};

// Ordinal -> string table. Strings are stored as UTF-8.
class StringPool {
public:
    // nullptr when the ordinal is not present
    const std::string* find(uint32_t index) const;

    void put(uint32_t index, std::string value);

    // Copies every entry of other, replacing equal ordinals
    void merge(const StringPool& other);

    size_t size() const { return strings_.size(); }
    bool empty() const { return strings_.empty(); }

    // Entries ordered by ordinal
    std::vector<std::pair<uint32_t, std::string>> entries() const;

private:
    std::unordered_map<uint32_t, std::string> strings_;
};

struct StringPoolDecodeResult {
    bool ok = false;
    ParseError error;
    StringPoolHeader header;
    StringPool pool;
};

// Decode the string pool chunk starting at chunk_start. Offsets in the pool are relative
// to the pool chunk itself, not to any enclosing chunk.
StringPoolDecodeResult decode_string_pool(const std::vector<uint8_t>& data, size_t chunk_start);

// Decode the string pool into an existing table (used for the global pool, which may be
// spread over several chunks).
bool decode_string_pool_into(const std::vector<uint8_t>& data, size_t chunk_start,
                             StringPool& pool, ParseError& error);

// UTF-16 code units to UTF-8; unpaired surrogates become U+FFFD.
std::string utf16_to_utf8(const std::vector<uint16_t>& units);

// Copy of a UTF-8 byte range with every invalid sequence replaced by U+FFFD.
std::string sanitize_utf8(const uint8_t* bytes, size_t size);

// Strip leading and trailing characters <= U+0020.
std::string trim_control(const std::string& s);

} // namespace arsc
