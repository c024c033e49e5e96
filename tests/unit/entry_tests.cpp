#include <doctest/doctest.h>
#include <arsc/entry.hpp>

#include "../support/arsc_builder.hpp"

using namespace arsc;

namespace {

ChunkHeader chunk_at(const std::vector<uint8_t>& data, size_t offset = 0) {
    return read_chunk_header(data, offset)->value;
}

} // namespace

// ============================================================================
// Type spec
// ============================================================================

TEST_CASE("type spec header and flags are decoded") {
    DecodeContext ctx(strict_options());
    auto bytes = test::type_spec_chunk(3, 2, 0, {SPEC_PUBLIC, 0});

    auto result = decode_type_spec(bytes, chunk_at(bytes), ctx);
    REQUIRE(result.ok);
    CHECK(result.header.id == 3);
    CHECK(result.header.entry_count == 2);
    REQUIRE(result.header.spec_flags.size() == 2);
    CHECK(result.header.spec_flags[0] == SPEC_PUBLIC);
    CHECK(result.header.spec_flags[1] == 0);
}

TEST_CASE("type spec with id zero violates the format") {
    auto bytes = test::type_spec_chunk(0, 0);

    SUBCASE("strict") {
        DecodeContext ctx(strict_options());
        auto result = decode_type_spec(bytes, chunk_at(bytes), ctx);
        CHECK_FALSE(result.ok);
        CHECK(result.error.kind == ErrorKind::FormatViolation);
    }

    SUBCASE("lenient") {
        DecodeContext ctx(lenient_options());
        auto result = decode_type_spec(bytes, chunk_at(bytes), ctx);
        CHECK(result.ok);
        CHECK(ctx.warnings.get_warnings().size() == 1);
    }
}

TEST_CASE("type spec res0 must be zero in strict mode") {
    DecodeContext ctx(strict_options());
    auto bytes = test::type_spec_chunk(1, 0, 7);

    auto result = decode_type_spec(bytes, chunk_at(bytes), ctx);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::FormatViolation);
}

// ============================================================================
// Type header
// ============================================================================

TEST_CASE("type header reads counts and config") {
    DecodeContext ctx(strict_options());
    auto bytes = test::type_chunk(2, {test::simple_entry(0, 0, TYPE_INT_DEC, 1),
                                      test::simple_entry(2, 1, TYPE_INT_DEC, 2)});

    auto result = decode_type_header(bytes, chunk_at(bytes), ctx);
    REQUIRE(result.ok);
    CHECK(result.header.id == 2);
    CHECK_FALSE(result.header.sparse());
    CHECK(result.header.entry_count == 3);
    CHECK(result.header.entries_start == 20 + 28 + 3 * 4);
    CHECK(result.header.index_start == 48);
    CHECK(result.header.config.size == 28);
}

TEST_CASE("FLAG_OFFSET16 is unsupported in any mode") {
    test::TypeChunkOptions options;
    options.extra_flags = FLAG_OFFSET16;
    auto bytes = test::type_chunk(1, {test::simple_entry(0, 0, TYPE_NULL, 0)}, options);

    DecodeContext strict(strict_options());
    auto a = decode_type_header(bytes, chunk_at(bytes), strict);
    CHECK_FALSE(a.ok);
    CHECK(a.error.kind == ErrorKind::UnsupportedFeature);

    DecodeContext lenient(lenient_options());
    auto b = decode_type_header(bytes, chunk_at(bytes), lenient);
    CHECK_FALSE(b.ok);
    CHECK(b.error.kind == ErrorKind::UnsupportedFeature);
}

TEST_CASE("unknown type flags violate the format") {
    test::TypeChunkOptions options;
    options.extra_flags = 0x04;
    auto bytes = test::type_chunk(1, {test::simple_entry(0, 0, TYPE_NULL, 0)}, options);

    DecodeContext strict(strict_options());
    CHECK(decode_type_header(bytes, chunk_at(bytes), strict).error.kind == ErrorKind::FormatViolation);

    DecodeContext lenient(lenient_options());
    CHECK(decode_type_header(bytes, chunk_at(bytes), lenient).ok);
}

TEST_CASE("non-zero reserved field violates the format") {
    test::TypeChunkOptions options;
    options.reserved = 1;
    auto bytes = test::type_chunk(1, {test::simple_entry(0, 0, TYPE_NULL, 0)}, options);

    DecodeContext ctx(strict_options());
    auto result = decode_type_header(bytes, chunk_at(bytes), ctx);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::FormatViolation);
}

TEST_CASE("short type header is truncated") {
    DecodeContext ctx(strict_options());
    auto bytes = test::type_chunk(1, {});
    bytes.resize(16);

    auto result = decode_type_header(bytes, chunk_at(bytes), ctx);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::Truncated);
}

// ============================================================================
// Index table
// ============================================================================

TEST_CASE("dense index skips NO_ENTRY slots") {
    DecodeContext ctx(strict_options());
    auto bytes = test::type_chunk(1, {test::simple_entry(0, 0, TYPE_INT_DEC, 1),
                                      test::simple_entry(3, 1, TYPE_INT_DEC, 2)});
    auto header = decode_type_header(bytes, chunk_at(bytes), ctx);
    REQUIRE(header.ok);

    auto index = decode_index_table(bytes, header.header);
    REQUIRE(index.ok);
    REQUIRE(index.entries.size() == 2);
    CHECK(index.entries[0].index == 0);
    CHECK(index.entries[0].offset == header.header.entries_start);
    CHECK(index.entries[1].index == 3);
    CHECK(index.entries[1].offset == header.header.entries_start + 16);
}

TEST_CASE("sparse index stores offsets divided by four") {
    DecodeContext ctx(strict_options());
    test::TypeChunkOptions options;
    options.sparse = true;
    auto bytes = test::type_chunk(1, {test::simple_entry(5, 0, TYPE_INT_DEC, 1),
                                      test::simple_entry(900, 1, TYPE_INT_DEC, 2)}, options);
    auto header = decode_type_header(bytes, chunk_at(bytes), ctx);
    REQUIRE(header.ok);
    CHECK(header.header.sparse());

    auto index = decode_index_table(bytes, header.header);
    REQUIRE(index.ok);
    REQUIRE(index.entries.size() == 2);
    CHECK(index.entries[0].index == 5);
    CHECK(index.entries[1].index == 900);
    CHECK(index.entries[1].offset == header.header.entries_start + 16);
}

TEST_CASE("index table past the buffer is truncated") {
    DecodeContext ctx(strict_options());
    test::TypeChunkOptions options;
    options.entry_count = 4;
    auto bytes = test::type_chunk(1, {test::simple_entry(0, 0, TYPE_INT_DEC, 1)}, options);
    auto header = decode_type_header(bytes, chunk_at(bytes), ctx);
    REQUIRE(header.ok);

    bytes.resize(header.header.index_start + 6);
    auto index = decode_index_table(bytes, header.header);
    CHECK_FALSE(index.ok);
    CHECK(index.error.kind == ErrorKind::Truncated);
}

// ============================================================================
// Entry header
// ============================================================================

TEST_CASE("simple entry header") {
    DecodeContext ctx(strict_options());
    auto bytes = test::entry_bytes(test::simple_entry(0, 7, TYPE_INT_DEC, 1));

    auto result = decode_entry_header(bytes, 0, 0, ctx);
    CHECK_FALSE(result.malformed);
    CHECK(result.header.size == 8);
    CHECK(result.header.key == 7);
    CHECK_FALSE(result.header.complex());
    CHECK(result.header.value_start == 8);
}

TEST_CASE("map entry header reads parent and count") {
    DecodeContext ctx(strict_options());
    auto e = test::map_entry(0, 2, {{1, TYPE_INT_DEC, 5}, {2, TYPE_INT_DEC, 6}});
    e.parent = 0x7f050000;
    auto bytes = test::entry_bytes(e);

    auto result = decode_entry_header(bytes, 0, 0, ctx);
    CHECK_FALSE(result.malformed);
    CHECK(result.header.complex());
    CHECK(result.header.parent == 0x7f050000);
    CHECK(result.header.count == 2);
    CHECK(result.header.value_start == 16);
}

TEST_CASE("unexpected entry header sizes are malformed") {
    DecodeContext ctx(strict_options());
    auto e = test::simple_entry(0, 0, TYPE_INT_DEC, 1);
    e.header_size = 12;
    auto bytes = test::entry_bytes(e);

    auto result = decode_entry_header(bytes, 4, 0, ctx);
    CHECK(result.malformed);

    auto warnings = ctx.warnings.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "malformed_value");
}

TEST_CASE("complex flag on a simple-sized entry is malformed") {
    DecodeContext ctx(strict_options());
    auto e = test::simple_entry(0, 0, TYPE_INT_DEC, 1);
    e.flags = FLAG_COMPLEX;
    auto bytes = test::entry_bytes(e);

    CHECK(decode_entry_header(bytes, 0, 0, ctx).malformed);
}

TEST_CASE("entry offsets past the buffer are reported") {
    DecodeContext ctx(strict_options());
    std::vector<uint8_t> bytes(4);

    auto result = decode_entry_header(bytes, 9, 0, ctx);
    CHECK(result.malformed);
    auto warnings = ctx.warnings.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "entry_out_of_bounds");
    CHECK(warnings[0].fields.at("entry") == "9");
}

TEST_CASE("weak and compact flags are reported once per kind") {
    DecodeContext ctx(strict_options());
    auto weak = test::simple_entry(0, 0, TYPE_INT_DEC, 1);
    weak.flags = FLAG_WEAK;
    auto compact = test::simple_entry(0, 0, TYPE_INT_DEC, 1);
    compact.flags = FLAG_COMPACT;
    auto weak_bytes = test::entry_bytes(weak);
    auto compact_bytes = test::entry_bytes(compact);

    CHECK_FALSE(decode_entry_header(weak_bytes, 0, 0, ctx).malformed);
    CHECK_FALSE(decode_entry_header(weak_bytes, 1, 0, ctx).malformed);
    CHECK_FALSE(decode_entry_header(compact_bytes, 2, 0, ctx).malformed);
    CHECK_FALSE(decode_entry_header(compact_bytes, 3, 0, ctx).malformed);

    auto warnings = ctx.warnings.get_warnings();
    REQUIRE(warnings.size() == 2);
    CHECK(warnings[0].fields.at("flags") == "FLAG_WEAK");
    CHECK(warnings[1].fields.at("flags") == "FLAG_COMPACT");
}
