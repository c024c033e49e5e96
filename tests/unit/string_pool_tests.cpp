#include <doctest/doctest.h>
#include <arsc/string_pool.hpp>

#include "../support/arsc_builder.hpp"

using namespace arsc;

TEST_CASE("UTF-16 pool decodes strings in ordinal order") {
    auto bytes = test::string_pool({"alpha", "beta", "gamma"});

    auto result = decode_string_pool(bytes, 0);
    REQUIRE(result.ok);
    CHECK(result.header.string_count == 3);
    CHECK_FALSE(result.header.utf8);
    REQUIRE(result.pool.size() == 3);
    CHECK(*result.pool.find(0) == "alpha");
    CHECK(*result.pool.find(1) == "beta");
    CHECK(*result.pool.find(2) == "gamma");
    CHECK(result.pool.find(3) == nullptr);
}

TEST_CASE("UTF-8 pool decodes strings") {
    auto bytes = test::utf8_string_pool({"hello", "world"});

    auto result = decode_string_pool(bytes, 0);
    REQUIRE(result.ok);
    CHECK(result.header.utf8);
    CHECK(*result.pool.find(0) == "hello");
    CHECK(*result.pool.find(1) == "world");
}

TEST_CASE("UTF-8 strings with a two-byte length keep valid UTF-8") {
    // 200 bytes: both lengths take the two-byte form 0x80 0xC8
    std::vector<uint8_t> record = {0x80, 0xC8, 0x80, 0xC8};
    record.insert(record.end(), 200, 'a');
    record.push_back(0);

    auto result = decode_string_pool(test::utf8_raw_pool({record}), 0);
    REQUIRE(result.ok);
    const std::string* value = result.pool.find(0);
    REQUIRE(value != nullptr);
    CHECK(*value == "\xEF\xBF\xBD\xEF\xBF\xBD" + std::string(198, 'a'));
}

TEST_CASE("UTF-8 multi-byte strings pass through") {
    std::vector<uint8_t> record = {2, 5, 'c', 'a', 'f', 0xC3, 0xA9, 0};

    auto result = decode_string_pool(test::utf8_raw_pool({record}), 0);
    REQUIRE(result.ok);
    CHECK(*result.pool.find(0) == "caf\xC3\xA9");
}

TEST_CASE("sanitize_utf8 replaces invalid sequences") {
    auto run = [](std::vector<uint8_t> bytes) { return sanitize_utf8(bytes.data(), bytes.size()); };

    CHECK(run({'o', 'k'}) == "ok");
    CHECK(run({0xF0, 0x9F, 0x98, 0x80}) == "\xF0\x9F\x98\x80");
    CHECK(run({0x80, 'x'}) == "\xEF\xBF\xBDx");
    CHECK(run({'x', 0xE2, 0x82}) == "x\xEF\xBF\xBD");
    CHECK(run({0xC0, 0x80}) == "\xEF\xBF\xBD\xEF\xBF\xBD");
    CHECK(run({0xED, 0xA0, 0x80}) == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    CHECK(run({0xFF}) == "\xEF\xBF\xBD");
}

TEST_CASE("pool strings are trimmed of control characters and spaces") {
    auto bytes = test::string_pool({"  padded\t", "\n", "in side"});

    auto result = decode_string_pool(bytes, 0);
    REQUIRE(result.ok);
    CHECK(*result.pool.find(0) == "padded");
    CHECK(*result.pool.find(1) == "");
    CHECK(*result.pool.find(2) == "in side");
}

TEST_CASE("zero-length strings decode to the empty string") {
    auto bytes = test::string_pool({"", "x"});

    auto result = decode_string_pool(bytes, 0);
    REQUIRE(result.ok);
    REQUIRE(result.pool.find(0) != nullptr);
    CHECK(result.pool.find(0)->empty());
    CHECK(*result.pool.find(1) == "x");
}

TEST_CASE("UTF-16 surrogate pairs become one code point") {
    // U+1F600, then a lone high surrogate
    auto bytes = test::utf16_units_pool({{0xD83D, 0xDE00}, {0x0041, 0xD800}, {0x00E9}});

    auto result = decode_string_pool(bytes, 0);
    REQUIRE(result.ok);
    CHECK(*result.pool.find(0) == "\xF0\x9F\x98\x80");
    CHECK(*result.pool.find(1) == "A\xEF\xBF\xBD");
    CHECK(*result.pool.find(2) == "\xC3\xA9");
}

TEST_CASE("pool offsets are relative to the pool chunk") {
    std::vector<uint8_t> bytes(20, 0xEE);
    auto pool = test::string_pool({"shifted"});
    bytes.insert(bytes.end(), pool.begin(), pool.end());

    auto result = decode_string_pool(bytes, 20);
    REQUIRE(result.ok);
    CHECK(*result.pool.find(0) == "shifted");
}

TEST_CASE("a non-pool chunk is a structural error") {
    auto bytes = test::type_spec_chunk(1, 0);

    auto result = decode_string_pool(bytes, 0);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::StructuralInconsistency);
}

TEST_CASE("string data past the buffer end is a truncation") {
    auto bytes = test::string_pool({"truncate me"});
    bytes.resize(bytes.size() - 12);

    auto result = decode_string_pool(bytes, 0);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::Truncated);
}

TEST_CASE("StringPool merge replaces equal ordinals") {
    StringPool a;
    a.put(0, "a0");
    a.put(1, "a1");

    StringPool b;
    b.put(1, "b1");
    b.put(5, "b5");

    a.merge(b);
    CHECK(a.size() == 3);
    CHECK(*a.find(0) == "a0");
    CHECK(*a.find(1) == "b1");
    CHECK(*a.find(5) == "b5");

    auto entries = a.entries();
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].first == 0);
    CHECK(entries[1].first == 1);
    CHECK(entries[2].first == 5);
}

TEST_CASE("decode_string_pool_into accumulates several chunks") {
    StringPool pool;
    ParseError error;

    auto first = test::string_pool({"one"});
    REQUIRE(decode_string_pool_into(first, 0, pool, error));
    auto second = test::string_pool({"uno", "dos"});
    REQUIRE(decode_string_pool_into(second, 0, pool, error));

    CHECK(pool.size() == 2);
    CHECK(*pool.find(0) == "uno");
    CHECK(*pool.find(1) == "dos");
}

TEST_CASE("trim_control keeps interior characters") {
    CHECK(trim_control(" \x01 a b \x1f") == "a b");
    CHECK(trim_control("") == "");
    CHECK(trim_control("   ") == "");
}
