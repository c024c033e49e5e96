#pragma once

#include "arsc/byte_reader.hpp"
#include "arsc/config.hpp"
#include "arsc/decode_context.hpp"
#include "arsc/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace arsc {

// ============================================================================
// ResTable_typeSpec
// ============================================================================

struct TypeSpecHeader {
    ChunkHeader chunk;
    uint8_t id = 0;
    uint8_t res0 = 0;
    uint16_t types_count = 0;
    uint32_t entry_count = 0;
    std::vector<uint32_t> spec_flags;  // one per entry; SPEC_PUBLIC marks public entries
};

struct TypeSpecDecodeResult {
    bool ok = false;
    ParseError error;
    TypeSpecHeader header;
};

TypeSpecDecodeResult decode_type_spec(const std::vector<uint8_t>& data, const ChunkHeader& chunk,
                                      DecodeContext& ctx);

// ============================================================================
// ResTable_type
// ============================================================================

struct TypeHeader {
    ChunkHeader chunk;
    uint8_t id = 0;
    uint8_t flags = 0;
    uint16_t reserved = 0;
    uint32_t entry_count = 0;
    uint32_t entries_start = 0;  // relative to the chunk start
    ResTableConfig config;
    size_t index_start = 0;      // first byte after the config record

    bool sparse() const { return (flags & FLAG_SPARSE) != 0; }
};

struct TypeHeaderDecodeResult {
    bool ok = false;
    ParseError error;
    TypeHeader header;
};

// FLAG_OFFSET16 is rejected with UNSUPPORTED_FEATURE regardless of strictness.
TypeHeaderDecodeResult decode_type_header(const std::vector<uint8_t>& data, const ChunkHeader& chunk,
                                          DecodeContext& ctx);

// One populated slot of the index table
struct IndexEntry {
    uint32_t index = 0;   // entry index within the type
    size_t offset = 0;    // absolute offset of the ResTable_entry
};

struct IndexDecodeResult {
    bool ok = false;
    ParseError error;
    std::vector<IndexEntry> entries;
};

// Dense tables hold entry_count u32 offsets (NO_ENTRY marks a hole); sparse tables hold
// (u16 index, u16 offset / 4) pairs.
IndexDecodeResult decode_index_table(const std::vector<uint8_t>& data, const TypeHeader& type);

// ============================================================================
// ResTable_entry
// ============================================================================

constexpr uint16_t SIMPLE_ENTRY_SIZE = 8;
constexpr uint16_t MAP_ENTRY_SIZE = 16;

struct EntryHeader {
    uint16_t size = 0;
    uint16_t flags = 0;
    uint32_t key = 0;

    // ResTable_map_entry only
    uint32_t parent = 0;
    uint32_t count = 0;

    size_t value_start = 0;  // entry offset + size

    bool complex() const { return (flags & FLAG_COMPLEX) != 0; }
    bool is_public() const { return (flags & FLAG_PUBLIC) != 0; }
};

struct EntryDecodeResult {
    bool malformed = false;  // header could not be interpreted; skip the entry
    EntryHeader header;
};

// Never fatal. Weak and compact flags are reported once per kind per context.
EntryDecodeResult decode_entry_header(const std::vector<uint8_t>& data, uint32_t index, size_t offset,
                                      DecodeContext& ctx);

} // namespace arsc
