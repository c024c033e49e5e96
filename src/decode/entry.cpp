#include "arsc/entry.hpp"

#include <algorithm>

namespace arsc {

namespace {

constexpr size_t TYPE_SPEC_FIXED_SIZE = CHUNK_HEADER_SIZE + 8;
constexpr size_t TYPE_FIXED_SIZE = CHUNK_HEADER_SIZE + 12;

template <typename R>
R truncated(const std::string& what, size_t offset) {
    R result;
    result.error = make_error(ErrorKind::Truncated, what + " out of bounds", offset);
    return result;
}

} // namespace

TypeSpecDecodeResult decode_type_spec(const std::vector<uint8_t>& data, const ChunkHeader& chunk,
                                      DecodeContext& ctx) {
    if (!has_bytes(data, chunk.start, TYPE_SPEC_FIXED_SIZE)) {
        return truncated<TypeSpecDecodeResult>("type spec header", chunk.start);
    }

    TypeSpecDecodeResult result;
    result.header.chunk = chunk;

    size_t offset = chunk.start + CHUNK_HEADER_SIZE;
    auto id = read_u8(data, offset);
    result.header.id = id->value;
    if (result.header.id == 0 &&
        !ctx.format_violation("File format violation in type spec table: id is zero", offset,
                              result.error)) {
        return result;
    }

    auto res0 = read_u8(data, id->next);
    result.header.res0 = res0->value;
    if (result.header.res0 != 0 &&
        !ctx.format_violation("File format violation in type spec table: res0 is not zero", id->next,
                              result.error)) {
        return result;
    }

    auto types_count = read_u16(data, res0->next);
    result.header.types_count = types_count->value;
    auto entry_count = read_u32(data, types_count->next);
    result.header.entry_count = entry_count->value;

    // Flags trail the header; keep the ones that lie inside the chunk
    size_t flags_offset = chunk.start + std::max<size_t>(chunk.header_size, TYPE_SPEC_FIXED_SIZE);
    size_t flags_end = std::min(chunk.end(), data.size());
    for (uint32_t i = 0; i < result.header.entry_count && flags_offset + 4 <= flags_end; ++i) {
        auto flags = read_u32(data, flags_offset);
        result.header.spec_flags.push_back(flags->value);
        flags_offset = flags->next;
    }

    result.ok = true;
    return result;
}

TypeHeaderDecodeResult decode_type_header(const std::vector<uint8_t>& data, const ChunkHeader& chunk,
                                          DecodeContext& ctx) {
    if (!has_bytes(data, chunk.start, TYPE_FIXED_SIZE)) {
        return truncated<TypeHeaderDecodeResult>("type header", chunk.start);
    }

    TypeHeaderDecodeResult result;
    TypeHeader& header = result.header;
    header.chunk = chunk;

    size_t offset = chunk.start + CHUNK_HEADER_SIZE;
    auto id = read_u8(data, offset);
    header.id = id->value;
    if (header.id == 0 &&
        !ctx.format_violation("File format violation in type table: id is zero", offset, result.error)) {
        return result;
    }

    auto flags = read_u8(data, id->next);
    header.flags = flags->value;
    if (header.flags & FLAG_OFFSET16) {
        result.error = make_error(ErrorKind::UnsupportedFeature,
                                  "Unsupported resource type entry: FLAG_OFFSET16", id->next);
        return result;
    }
    if (header.flags > 1 &&
        !ctx.format_violation("File format violation in type table: flags is not zero or one",
                              id->next, result.error)) {
        return result;
    }

    auto reserved = read_u16(data, flags->next);
    header.reserved = reserved->value;
    if (header.reserved != 0 &&
        !ctx.format_violation("File format violation in type table: reserved is not zero",
                              flags->next, result.error)) {
        return result;
    }

    auto entry_count = read_u32(data, reserved->next);
    header.entry_count = entry_count->value;
    auto entries_start = read_u32(data, entry_count->next);
    header.entries_start = entries_start->value;

    auto config = decode_config(data, entries_start->next, ctx);
    if (!config.ok) {
        result.error = config.error;
        return result;
    }
    header.config = config.config;
    header.index_start = config.next;

    result.ok = true;
    return result;
}

IndexDecodeResult decode_index_table(const std::vector<uint8_t>& data, const TypeHeader& type) {
    IndexDecodeResult result;
    const size_t base = type.chunk.start + type.entries_start;
    size_t offset = type.index_start;

    for (uint32_t i = 0; i < type.entry_count; ++i) {
        if (type.sparse()) {
            auto index = read_u16(data, offset);
            if (!index) return truncated<IndexDecodeResult>("sparse index table", offset);
            auto quarter = read_u16(data, index->next);
            if (!quarter) return truncated<IndexDecodeResult>("sparse index table", index->next);
            offset = quarter->next;

            result.entries.push_back(
                IndexEntry{index->value, base + static_cast<size_t>(quarter->value) * 4});
        } else {
            auto entry_offset = read_u32(data, offset);
            if (!entry_offset) return truncated<IndexDecodeResult>("index table", offset);
            offset = entry_offset->next;

            if (entry_offset->value == NO_ENTRY) continue;
            result.entries.push_back(IndexEntry{i, base + entry_offset->value});
        }
    }

    result.ok = true;
    return result;
}

EntryDecodeResult decode_entry_header(const std::vector<uint8_t>& data, uint32_t index, size_t offset,
                                      DecodeContext& ctx) {
    EntryDecodeResult result;

    if (!has_bytes(data, offset, SIMPLE_ENTRY_SIZE)) {
        ctx.warnings.emit(Warning::entry_out_of_bounds, warnings::entry_out_of_bounds(index, offset));
        result.malformed = true;
        return result;
    }

    EntryHeader& header = result.header;
    auto size = read_u16(data, offset);
    header.size = size->value;
    auto flags = read_u16(data, size->next);
    header.flags = flags->value;
    auto key = read_u32(data, flags->next);
    header.key = key->value;

    bool weak = (header.flags & FLAG_WEAK) != 0;
    bool compact = (header.flags & FLAG_COMPACT) != 0;
    if (weak || compact) {
        bool report = false;
        if (weak) {
            report = !ctx.warned_weak;
            ctx.warned_weak = true;
        }
        if (compact) {
            report |= !ctx.warned_compact;
            ctx.warned_compact = true;
        }
        if (report) {
            ctx.warnings.emit(Warning::unsupported_entry_flags,
                              warnings::unsupported_entry_flags(weak, compact));
        }
    }

    if (header.size != SIMPLE_ENTRY_SIZE && header.size != MAP_ENTRY_SIZE) {
        ctx.warnings.emit(Warning::malformed_value,
                          warnings::malformed_value(std::to_string(index),
                                                    "entry header size " + std::to_string(header.size),
                                                    offset));
        result.malformed = true;
        return result;
    }

    if (header.size == MAP_ENTRY_SIZE) {
        if (!has_bytes(data, offset, MAP_ENTRY_SIZE)) {
            ctx.warnings.emit(Warning::entry_out_of_bounds, warnings::entry_out_of_bounds(index, offset));
            result.malformed = true;
            return result;
        }
        auto parent = read_u32(data, key->next);
        header.parent = parent->value;
        auto count = read_u32(data, parent->next);
        header.count = count->value;
    } else if (header.complex()) {
        ctx.warnings.emit(Warning::malformed_value,
                          warnings::malformed_value(std::to_string(index),
                                                    "complex entry without map header", offset));
        result.malformed = true;
        return result;
    }

    header.value_start = offset + header.size;
    return result;
}

} // namespace arsc
