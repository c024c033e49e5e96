#include "arsc/table_parser.hpp"

#include "arsc/byte_reader.hpp"
#include "arsc/entry.hpp"
#include "arsc/string_pool.hpp"
#include "arsc/value.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>

#include <spdlog/spdlog.h>

namespace arsc {

namespace {

constexpr size_t PACKAGE_NAME_UNITS = 128;
constexpr size_t PACKAGE_HEADER_SIZE = CHUNK_HEADER_SIZE + 4 + PACKAGE_NAME_UNITS * 2 + 16;

TableParseResult failed(const ParseError& error) {
    TableParseResult result;
    result.error = error;
    return result;
}

std::string hex_id(uint32_t id) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%x", id);
    return buffer;
}

} // namespace

// ============================================================================
// Decoder
// ============================================================================

// Walks the chunk tree of one buffer and fills a ResourceTable.
class TableDecoder {
public:
    TableDecoder(const std::vector<uint8_t>& data, const ParseOptions& options)
        : data_(data), ctx_(options) {}

    TableParseResult run() {
        TableParseResult result;
        if (!decode_table(result.error)) {
            result.warnings = ctx_.warnings.get_warnings();
            return result;
        }
        result.ok = true;
        result.table = std::move(table_);
        result.warnings = ctx_.warnings.get_warnings();
        return result;
    }

private:
    const std::vector<uint8_t>& data_;
    DecodeContext ctx_;
    ResourceTable table_;

    // A sibling walk only advances when every chunk lies inside its parent
    bool checked_chunk(size_t offset, size_t parent_end, ChunkHeader& chunk, ParseError& error) {
        auto header = read_chunk_header(data_, offset);
        if (!header) {
            error = make_error(ErrorKind::Truncated, "chunk header out of bounds", offset);
            return false;
        }
        chunk = header->value;
        if (chunk.size < CHUNK_HEADER_SIZE) {
            error = make_error(ErrorKind::StructuralInconsistency,
                               "chunk size " + std::to_string(chunk.size) + " is smaller than its header",
                               offset);
            return false;
        }
        if (chunk.end() > parent_end) {
            error = make_error(ErrorKind::StructuralInconsistency,
                               "chunk extends past the end of its parent", offset);
            return false;
        }
        return true;
    }

    bool decode_table(ParseError& error) {
        auto header = read_chunk_header(data_, 0);
        auto package_count = read_u32(data_, CHUNK_HEADER_SIZE);
        if (!header || !package_count) {
            error = make_error(ErrorKind::Truncated, "resource table header out of bounds", 0);
            return false;
        }

        const ChunkHeader& table = header->value;
        if (table.type != RES_TABLE_TYPE) {
            error = make_error(ErrorKind::StructuralInconsistency,
                               "not a resource table (chunk type " + hex_id(table.type) + ")", 0);
            return false;
        }
        if (table.size <= table.header_size) {
            spdlog::debug("Resource table is empty");
            return true;
        }
        if (table.end() > data_.size()) {
            error = make_error(ErrorKind::Truncated, "resource table extends past the end of the input",
                               data_.size());
            return false;
        }

        spdlog::debug("Resource table: size={} packages={}", table.size, package_count->value);

        size_t offset = table.header_size;
        uint32_t package_index = 0;
        while (offset + 1 < table.end()) {
            ChunkHeader chunk;
            if (!checked_chunk(offset, table.end(), chunk, error)) return false;

            if (chunk.type == RES_STRING_POOL_TYPE) {
                if (!decode_string_pool_into(data_, chunk.start, table_.global_pool_, error)) {
                    return false;
                }
                spdlog::debug("Global string pool: {} strings", table_.global_pool_.size());
            } else if (chunk.type == RES_TABLE_PACKAGE_TYPE) {
                if (!decode_package(chunk, package_index, error)) return false;
                package_index++;
            } else {
                spdlog::debug("Skipping chunk type 0x{:04x} at offset 0x{:x}", chunk.type, chunk.start);
            }

            offset = chunk.end();
        }

        return true;
    }

    bool decode_package_pool(const ChunkHeader& package, uint32_t pool_offset, const char* what,
                             StringPool& pool, ChunkHeader& pool_chunk, ParseError& error) {
        size_t start = package.start + pool_offset;
        auto header = read_chunk_header(data_, start);
        if (!header) {
            error = make_error(ErrorKind::Truncated, std::string("package ") + what + " out of bounds",
                               start);
            return false;
        }
        if (header->value.type != RES_STRING_POOL_TYPE) {
            error = make_error(ErrorKind::StructuralInconsistency,
                               std::string("Unexpected block type for package ") + what, start);
            return false;
        }

        auto decoded = decode_string_pool(data_, start);
        if (!decoded.ok) {
            error = decoded.error;
            return false;
        }
        pool = std::move(decoded.pool);
        pool_chunk = header->value;
        return true;
    }

    bool decode_package(const ChunkHeader& chunk, uint32_t package_index, ParseError& error) {
        if (!has_bytes(data_, chunk.start, PACKAGE_HEADER_SIZE)) {
            error = make_error(ErrorKind::Truncated, "package header out of bounds", chunk.start);
            return false;
        }

        size_t offset = chunk.start + CHUNK_HEADER_SIZE;
        auto id = read_u32(data_, offset);
        offset = id->next;

        std::vector<uint16_t> name_units;
        for (size_t i = 0; i < PACKAGE_NAME_UNITS; ++i) {
            auto unit = read_u16(data_, offset + i * 2);
            if (unit->value == 0) break;
            name_units.push_back(unit->value);
        }
        offset += PACKAGE_NAME_UNITS * 2;
        std::string name = utf16_to_utf8(name_units);

        auto type_strings = read_u32(data_, offset);
        auto last_public_type = read_u32(data_, type_strings->next);
        auto key_strings = read_u32(data_, last_public_type->next);

        spdlog::debug("Package {} id={} name={}", package_index, id->value, name);

        StringPool type_pool;
        StringPool key_pool;
        ChunkHeader type_chunk;
        ChunkHeader key_chunk;
        if (!decode_package_pool(chunk, type_strings->value, "type strings", type_pool, type_chunk,
                                 error)) {
            return false;
        }
        if (!decode_package_pool(chunk, key_strings->value, "key strings", key_pool, key_chunk, error)) {
            return false;
        }

        Package* package = table_.package(id->value, name);
        if (!package) {
            Package created;
            created.id = id->value;
            created.name = name;
            table_.packages_.push_back(std::move(created));
            package = &table_.packages_.back();
        }

        // Type-spec and type chunks follow the key string pool
        offset = key_chunk.end();
        while (offset < chunk.end()) {
            ChunkHeader inner;
            if (!checked_chunk(offset, chunk.end(), inner, error)) return false;

            if (inner.type == RES_TABLE_TYPE_SPEC_TYPE) {
                if (!decode_type_spec_chunk(*package, inner, type_pool, error)) return false;
            } else if (inner.type == RES_TABLE_TYPE_TYPE) {
                if (!decode_type_chunk(*package, inner, key_pool, error)) return false;
            }

            offset = inner.end();
        }

        if (spdlog::should_log(spdlog::level::trace)) {
            for (const auto& type : package->types) {
                spdlog::trace("Type {} ({}), configCount={}, entryCount={}", type.name, type.id - 1,
                              type.configs.size(),
                              type.configs.empty() ? 0 : type.configs.front().resources.size());
                for (const auto& config : type.configs) {
                    spdlog::trace("  config {}", config.config.to_string());
                    for (const auto& res : config.resources) {
                        spdlog::trace("    resource {}: {}", hex_id(res.id), res.name);
                    }
                }
            }
        }

        return true;
    }

    bool decode_type_spec_chunk(Package& package, const ChunkHeader& chunk, const StringPool& type_pool,
                                ParseError& error) {
        auto spec = decode_type_spec(data_, chunk, ctx_);
        if (!spec.ok) {
            error = spec.error;
            return false;
        }

        uint32_t name_index = static_cast<uint32_t>(spec.header.id) - 1;
        std::string type_name;
        if (const std::string* found = type_pool.find(name_index)) {
            type_name = *found;
        } else {
            ctx_.warnings.emit(Warning::missing_string, warnings::missing_string("type", name_index));
        }

        Type* type = package.type(spec.header.id, type_name);
        if (!type) {
            Type created;
            created.id = spec.header.id;
            created.name = type_name;
            package.types.push_back(std::move(created));
            type = &package.types.back();
        }
        if (type->spec_flags.empty()) type->spec_flags = std::move(spec.header.spec_flags);

        spdlog::debug("Type spec {} id={} entries={}", type->name, type->id, spec.header.entry_count);
        return true;
    }

    bool decode_type_chunk(Package& package, const ChunkHeader& chunk, const StringPool& key_pool,
                           ParseError& error) {
        auto decoded = decode_type_header(data_, chunk, ctx_);
        if (!decoded.ok) {
            error = decoded.error;
            return false;
        }
        const TypeHeader& header = decoded.header;

        Type* type = nullptr;
        for (auto& t : package.types) {
            if (t.id == header.id) {
                type = &t;
                break;
            }
        }
        if (!type) {
            error = make_error(ErrorKind::StructuralInconsistency,
                               "Reference to undeclared type found (id " + std::to_string(header.id) + ")",
                               chunk.start);
            return false;
        }

        Config* config = type->configuration(header.config);
        if (!config) {
            Config created;
            created.config = header.config;
            type->configs.push_back(std::move(created));
            config = &type->configs.back();
        }

        auto index = decode_index_table(data_, header);
        if (!index.ok) {
            error = index.error;
            return false;
        }

        for (const auto& slot : index.entries) {
            auto entry = decode_entry_header(data_, slot.index, slot.offset, ctx_);
            if (entry.malformed) continue;

            Resource res;
            if (const std::string* key = key_pool.find(entry.header.key)) {
                res.name = *key;
            }
            res.id = make_resource_id(package.id, header.id, slot.index);

            if (entry.header.complex()) {
                auto complex = decode_complex_entry(data_, entry.header.value_start, entry.header.count,
                                                    type->name, table_.global_pool_, res.name, ctx_);
                if (!complex.ok) {
                    error = complex.error;
                    return false;
                }
                if (complex.skipped) continue;
                res.value = std::move(complex.value);
            } else {
                auto raw = decode_raw_value(data_, entry.header.value_start, res.name, ctx_);
                if (!raw.ok) {
                    error = raw.error;
                    return false;
                }
                if (raw.malformed) continue;

                // decode_value has already reported why the entry is unusable
                auto value = decode_value(raw.value, table_.global_pool_, res.name, ctx_);
                if (!value) continue;
                res.value = std::move(*value);
            }

            config->resources.push_back(std::move(res));
        }

        return true;
    }
};

// ============================================================================
// TableParser
// ============================================================================

TableParseResult TableParser::parse(const std::vector<uint8_t>& data) const {
    TableDecoder decoder(data, options_);
    return decoder.run();
}

TableParseResult TableParser::parse(std::istream& in) const {
    std::vector<uint8_t> data(TABLE_HEADER_SIZE);
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(TABLE_HEADER_SIZE));
    if (in.gcount() != static_cast<std::streamsize>(TABLE_HEADER_SIZE)) {
        return failed(make_error(ErrorKind::IOFailure, "Could not read resource table header",
                                 static_cast<size_t>(in.gcount())));
    }

    auto header = read_chunk_header(data, 0);
    if (header->value.size <= TABLE_HEADER_SIZE) return parse(data);

    // The declared size is untrusted; grow only as bytes arrive
    size_t remaining = header->value.size - TABLE_HEADER_SIZE;
    std::vector<uint8_t> block(READ_BLOCK_SIZE);
    while (remaining > 0) {
        size_t want = std::min(remaining, READ_BLOCK_SIZE);
        in.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            return failed(make_error(ErrorKind::IOFailure, "Could not read block from resource file",
                                     data.size()));
        }
        data.insert(data.end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(got));
        remaining -= got;
    }

    return parse(data);
}

TableParseResult TableParser::parse_file(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return failed(make_error(ErrorKind::IOFailure, "Could not open " + path, 0));
    }
    spdlog::debug("Parsing resource table {}", path);
    return parse(file);
}

} // namespace arsc
