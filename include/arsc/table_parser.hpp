#pragma once

#include "arsc/decode_context.hpp"
#include "arsc/resource_table.hpp"
#include "arsc/types.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace arsc {

// ============================================================================
// Table Parser
// ============================================================================

constexpr size_t TABLE_HEADER_SIZE = 12;
constexpr size_t READ_BLOCK_SIZE = 2048;

struct TableParseResult {
    bool ok = false;
    ParseError error;
    ResourceTable table;
    std::vector<WarningObject> warnings;
};

// Decodes a complete resources.arsc image. Each call starts from a fresh decode state,
// so one parser may be reused for several files.
class TableParser {
public:
    TableParser() = default;
    explicit TableParser(ParseOptions options) : options_(std::move(options)) {}

    const ParseOptions& options() const { return options_; }

    TableParseResult parse(const std::vector<uint8_t>& data) const;

    // Reads the 12-byte table header, then the rest of the table in READ_BLOCK_SIZE blocks.
    TableParseResult parse(std::istream& in) const;

    TableParseResult parse_file(const std::string& path) const;

private:
    ParseOptions options_;
};

} // namespace arsc
