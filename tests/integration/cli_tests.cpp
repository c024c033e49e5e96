#include <doctest/doctest.h>
#include <arsc/types.hpp>

#include "../support/arsc_builder.hpp"
#include "../support/test_dir.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <string>
#include <sys/wait.h>

using namespace arsc;
using arsc::test::TestDir;

#ifndef ARSC_CLI_PATH
#error "ARSC_CLI_PATH must name the arsc executable"
#endif

namespace {

struct CliRun {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Runs the arsc binary with stdout and stderr captured in dir
CliRun run_cli(const TestDir& dir, const std::string& args) {
    std::string cmd = std::string("\"") + ARSC_CLI_PATH + "\" " + args + " > \"" + dir.path("stdout.txt") +
                      "\" 2> \"" + dir.path("stderr.txt") + "\"";
    int status = std::system(cmd.c_str());

    CliRun run;
    if (status != -1 && WIFEXITED(status)) run.exit_code = WEXITSTATUS(status);
    run.out = dir.read_text("stdout.txt");
    run.err = dir.read_text("stderr.txt");
    return run;
}

std::string quoted(const std::string& path) {
    return "\"" + path + "\"";
}

std::vector<uint8_t> greeting_table() {
    return test::string_table({"Hello", "World"}, {"app_name", "subtitle"},
                              {test::simple_entry(0, 0, TYPE_STRING, 0),
                               test::simple_entry(1, 1, TYPE_STRING, 1)});
}

// Global pool in UTF-8 form holding one 200-byte string with a two-byte length prefix
std::vector<uint8_t> long_utf8_table() {
    std::vector<uint8_t> record = {0x80, 0xC8, 0x80, 0xC8};
    record.insert(record.end(), 200, 'a');
    record.push_back(0);

    return test::table({test::utf8_raw_pool({record}),
                        test::package_chunk(0x7f, "com.example", {"string"}, {"long_text"},
                                            {test::type_spec_chunk(1, 1),
                                             test::type_chunk(1, {test::simple_entry(0, 0, TYPE_STRING, 0)})})});
}

} // namespace

TEST_CASE("arsc dump prints the resource tree") {
    TestDir dir;
    auto file = dir.write("resources.arsc", greeting_table());

    auto run = run_cli(dir, "dump " + quoted(file));
    CHECK(run.exit_code == 0);
    CHECK(run.out.find("Package 127 (com.example)") != std::string::npos);
    CHECK(run.out.find("0x7f010000 app_name (string) = Hello") != std::string::npos);
    CHECK(run.out.find("0x7f010001 subtitle (string) = World") != std::string::npos);
}

TEST_CASE("arsc --json dump emits a parseable document") {
    TestDir dir;
    auto file = dir.write("resources.arsc", greeting_table());

    auto run = run_cli(dir, "--json dump " + quoted(file));
    REQUIRE(run.exit_code == 0);

    auto j = nlohmann::json::parse(run.out);
    CHECK(j["ok"] == true);
    REQUIRE(j["table"]["packages"].size() == 1);
    CHECK(j["table"]["packages"][0]["name"] == "com.example");
    CHECK(j["table"]["packages"][0]["types"][0]["configs"][0]["resources"][1]["value"] == "World");
}

TEST_CASE("arsc --json output stays valid for long UTF-8 strings") {
    TestDir dir;
    auto file = dir.write("long.arsc", long_utf8_table());

    auto dump = run_cli(dir, "--json dump " + quoted(file));
    REQUIRE(dump.exit_code == 0);
    auto j = nlohmann::json::parse(dump.out);
    CHECK(j["ok"] == true);

    auto strings = run_cli(dir, "--json strings " + quoted(file));
    REQUIRE(strings.exit_code == 0);
    auto pool = nlohmann::json::parse(strings.out);
    REQUIRE(pool["strings"].size() == 1);
    CHECK(pool["strings"][0]["value"] == "\xEF\xBF\xBD\xEF\xBF\xBD" + std::string(198, 'a'));
}

TEST_CASE("arsc find looks up by id and by name") {
    TestDir dir;
    auto file = dir.write("resources.arsc", greeting_table());

    auto by_id = run_cli(dir, "--json find " + quoted(file) + " --id 0x7f010001");
    REQUIRE(by_id.exit_code == 0);
    auto j = nlohmann::json::parse(by_id.out);
    CHECK(j["type"] == "string");
    REQUIRE(j["resources"].size() == 1);
    CHECK(j["resources"][0]["name"] == "subtitle");

    auto by_name = run_cli(dir, "find " + quoted(file) + " --name string/app_name");
    CHECK(by_name.exit_code == 0);
    CHECK(by_name.out.find("app_name (string) = Hello") != std::string::npos);
}

TEST_CASE("arsc find exits 1 for unknown resources") {
    TestDir dir;
    auto file = dir.write("resources.arsc", greeting_table());

    auto missing = run_cli(dir, "--json find " + quoted(file) + " --id 0x7f0100ff");
    CHECK(missing.exit_code == 1);
    auto j = nlohmann::json::parse(missing.out);
    CHECK(j["ok"] == false);

    auto bad_name = run_cli(dir, "find " + quoted(file) + " --name app_name");
    CHECK(bad_name.exit_code == 1);
    CHECK(bad_name.err.find("--name expects type/name") != std::string::npos);
}

TEST_CASE("arsc types lists one entry per name") {
    TestDir dir;
    auto file = dir.write("resources.arsc", greeting_table());

    auto run = run_cli(dir, "--json types " + quoted(file) + " string");
    REQUIRE(run.exit_code == 0);
    auto j = nlohmann::json::parse(run.out);
    CHECK(j["type"] == "string");
    CHECK(j["resources"].size() == 2);

    auto none = run_cli(dir, "types " + quoted(file) + " color");
    CHECK(none.exit_code == 0);
    CHECK(none.out.find("No resources of type color.") != std::string::npos);
}

TEST_CASE("arsc fails on a truncated table") {
    TestDir dir;
    auto bytes = greeting_table();
    bytes.resize(bytes.size() - 8);
    auto file = dir.write("short.arsc", bytes);

    auto run = run_cli(dir, "--json dump " + quoted(file));
    CHECK(run.exit_code == 1);
    auto j = nlohmann::json::parse(run.out);
    CHECK(j["ok"] == false);
    CHECK(j["error"]["kind"] == "IO_FAILURE");
}

TEST_CASE("arsc --lenient tolerates reserved-field violations") {
    TestDir dir;
    auto entry = test::simple_entry(0, 0, TYPE_STRING, 0);
    entry.res0 = 2;
    auto file = dir.write("odd.arsc", test::string_table({"Hello"}, {"greeting"}, {entry}));

    auto strict = run_cli(dir, "dump " + quoted(file));
    CHECK(strict.exit_code == 1);
    CHECK(strict.err.find("FORMAT_VIOLATION") != std::string::npos);

    auto lenient = run_cli(dir, "--lenient dump " + quoted(file));
    CHECK(lenient.exit_code == 0);
    CHECK(lenient.out.find("greeting (string) = Hello") != std::string::npos);
}
