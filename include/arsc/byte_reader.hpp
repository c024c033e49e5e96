#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace arsc {

// A decoded value together with the offset just past it.
template <typename T>
struct Read {
    T value;
    size_t next;
};

// True when [offset, offset + count) lies inside data.
inline bool has_bytes(const std::vector<uint8_t>& data, size_t offset, size_t count) {
    return offset <= data.size() && count <= data.size() - offset;
}

// Little-endian reads; std::nullopt when the value crosses the end of the buffer.
std::optional<Read<uint8_t>> read_u8(const std::vector<uint8_t>& data, size_t offset);
std::optional<Read<uint16_t>> read_u16(const std::vector<uint8_t>& data, size_t offset);
std::optional<Read<uint32_t>> read_u32(const std::vector<uint8_t>& data, size_t offset);

// ============================================================================
// ResChunk_header
// ============================================================================

constexpr size_t CHUNK_HEADER_SIZE = 8;

struct ChunkHeader {
    uint16_t type = 0;
    uint16_t header_size = 0;
    uint32_t size = 0;   // total extent including header and payload
    size_t start = 0;    // offset of the header inside the buffer

    size_t end() const { return start + size; }
};

std::optional<Read<ChunkHeader>> read_chunk_header(const std::vector<uint8_t>& data, size_t offset);

} // namespace arsc
