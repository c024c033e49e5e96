#include "arsc/byte_reader.hpp"

namespace arsc {

std::optional<Read<uint8_t>> read_u8(const std::vector<uint8_t>& data, size_t offset) {
    if (!has_bytes(data, offset, 1)) return std::nullopt;
    return Read<uint8_t>{data[offset], offset + 1};
}

std::optional<Read<uint16_t>> read_u16(const std::vector<uint8_t>& data, size_t offset) {
    if (!has_bytes(data, offset, 2)) return std::nullopt;
    uint16_t value = static_cast<uint16_t>(data[offset]) |
                     static_cast<uint16_t>(data[offset + 1] << 8);
    return Read<uint16_t>{value, offset + 2};
}

std::optional<Read<uint32_t>> read_u32(const std::vector<uint8_t>& data, size_t offset) {
    if (!has_bytes(data, offset, 4)) return std::nullopt;
    uint32_t value = static_cast<uint32_t>(data[offset]) |
                     (static_cast<uint32_t>(data[offset + 1]) << 8) |
                     (static_cast<uint32_t>(data[offset + 2]) << 16) |
                     (static_cast<uint32_t>(data[offset + 3]) << 24);
    return Read<uint32_t>{value, offset + 4};
}

std::optional<Read<ChunkHeader>> read_chunk_header(const std::vector<uint8_t>& data, size_t offset) {
    auto type = read_u16(data, offset);
    if (!type) return std::nullopt;
    auto header_size = read_u16(data, type->next);
    if (!header_size) return std::nullopt;
    auto size = read_u32(data, header_size->next);
    if (!size) return std::nullopt;

    ChunkHeader header;
    header.type = type->value;
    header.header_size = header_size->value;
    header.size = size->value;
    header.start = offset;
    return Read<ChunkHeader>{header, size->next};
}

} // namespace arsc
