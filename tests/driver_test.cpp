// Command-line driver tests

#include "stamp/driver.hpp"

#include "test_doubles.hpp"

#include <format>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace stamp;
using stamp::test_support::ScratchDir;

namespace {

Result<Invocation> parse(std::vector<const char *> args) {
    args.insert(args.begin(), "stamp");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

void write_file(const std::filesystem::path &path, std::string_view bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << bytes;
}

} // namespace

TEST(CommandLineTest, ParsesOptionsAndCommand) {
    auto inv = parse({"-f", "rules.json", "--cache-dir", "/tmp/c", "--mangle", "--json", "--trace", "keys"});
    ASSERT_TRUE(inv.has_value()) << inv.error();
    EXPECT_EQ(inv->command, Command::KEYS);
    EXPECT_EQ(inv->config.manifest, "rules.json");
    EXPECT_EQ(inv->config.cache_dir.string(), "/tmp/c");
    EXPECT_TRUE(inv->config.mangle);
    EXPECT_TRUE(inv->config.json);
    EXPECT_EQ(inv->config.verbosity, Verbosity::TRACE);
}

TEST(CommandLineTest, Defaults) {
    auto inv = parse({"status"});
    ASSERT_TRUE(inv.has_value());
    EXPECT_EQ(inv->command, Command::STATUS);
    EXPECT_EQ(inv->config.manifest, "stamp.json");
    EXPECT_EQ(inv->config.cache_dir.string(), ".stamp-cache");
    EXPECT_FALSE(inv->config.mangle);
    EXPECT_EQ(inv->config.verbosity, Verbosity::NORMAL);
}

TEST(CommandLineTest, OperandsFollowTheCommand) {
    auto inv = parse({"store", "//lib:a", "out.a", "-q"});
    ASSERT_TRUE(inv.has_value());
    EXPECT_EQ(inv->command, Command::STORE);
    EXPECT_EQ(inv->operands, (std::vector<std::string>{"//lib:a", "out.a"}));
    EXPECT_EQ(inv->config.verbosity, Verbosity::QUIET);
}

TEST(CommandLineTest, HelpAndVersion) {
    EXPECT_EQ(parse({"--help"})->command, Command::HELP);
    EXPECT_EQ(parse({"-v"})->command, Command::VERSION);
}

TEST(CommandLineTest, Errors) {
    EXPECT_FALSE(parse({}).has_value());
    EXPECT_FALSE(parse({"frobnicate"}).has_value());
    EXPECT_FALSE(parse({"--bogus", "keys"}).has_value());
    EXPECT_FALSE(parse({"keys", "-f"}).has_value());
}

class DriverTest : public ::testing::Test {
protected:
    ScratchDir dir_;
    std::ostringstream out_;
    std::ostringstream log_out_;
    Log log_{Verbosity::NORMAL, log_out_};

    void SetUp() override {
        write_file(dir_ / "util.src", "util");
        write_file(dir_ / "lib.src", "lib");
        write_file(dir_ / "lib.a", "archive bytes");
        write_file(dir_ / "stamp.json", std::format(R"({{
  "kinds": {{"lib": [{{"key": "srcs", "type": "files"}}, {{"key": "flags", "type": "strings"}}]}},
  "rules": [
    {{"name": "//util", "kind": "lib", "attrs": {{"srcs": ["{0}/util.src"]}}}},
    {{"name": "//lib", "kind": "lib", "deps": ["//util"], "attrs": {{"srcs": ["{0}/lib.src"], "flags": ["-O2"]}}}}
  ]
}})",
                                                    dir_.path().generic_string()));
    }

    Invocation invocation(Command command, std::vector<std::string> operands = {}) {
        Invocation inv;
        inv.command = command;
        inv.config.manifest = (dir_ / "stamp.json").string();
        inv.config.cache_dir = dir_ / "cache";
        inv.operands = std::move(operands);
        return inv;
    }

    std::string take_output() {
        std::string s = out_.str();
        out_.str("");
        return s;
    }
};

TEST_F(DriverTest, KeysPrintsOneLinePerRule) {
    ASSERT_EQ(run(invocation(Command::KEYS), out_, log_), 0);
    std::string text = take_output();
    EXPECT_NE(text.find("  //util\n"), std::string::npos);
    EXPECT_NE(text.find("  //lib\n"), std::string::npos);
}

TEST_F(DriverTest, StoreThenStatusSkips) {
    ASSERT_EQ(run(invocation(Command::STATUS), out_, log_), 0);
    EXPECT_NE(take_output().find("rebuild  cached=0 inputs=0 uncached-deps=1  //lib"), std::string::npos);

    ASSERT_EQ(run(invocation(Command::STORE, {"//util", (dir_ / "lib.a").string()}), out_, log_), 0);
    ASSERT_EQ(run(invocation(Command::STORE, {"//lib", (dir_ / "lib.a").string()}), out_, log_), 0);
    take_output();

    ASSERT_EQ(run(invocation(Command::STATUS), out_, log_), 0);
    std::string text = take_output();
    EXPECT_NE(text.find("skip     cached=1 inputs=1 uncached-deps=0  //lib"), std::string::npos) << text;
    EXPECT_NE(text.find("skip     cached=1 inputs=1 uncached-deps=0  //util"), std::string::npos) << text;
}

TEST_F(DriverTest, EditedSourceForcesRebuild) {
    ASSERT_EQ(run(invocation(Command::STORE, {"//util", (dir_ / "lib.a").string()}), out_, log_), 0);
    ASSERT_EQ(run(invocation(Command::STORE, {"//lib", (dir_ / "lib.a").string()}), out_, log_), 0);
    take_output();

    write_file(dir_ / "util.src", "util, edited");
    ASSERT_EQ(run(invocation(Command::STATUS), out_, log_), 0);
    std::string text = take_output();
    EXPECT_NE(text.find("rebuild  cached=0 inputs=0 uncached-deps=0  //util"), std::string::npos) << text;
    EXPECT_NE(text.find("rebuild  cached=0 inputs=0 uncached-deps=1  //lib"), std::string::npos) << text;
}

TEST_F(DriverTest, StoreReportsThroughTheLog) {
    ASSERT_EQ(run(invocation(Command::STORE, {"//util", (dir_ / "lib.a").string()}), out_, log_), 0);
    EXPECT_TRUE(take_output().empty());
    EXPECT_EQ(log_out_.str().rfind("stored //util as ", 0), 0u) << log_out_.str();
}

TEST_F(DriverTest, StoreUnknownRuleFails) {
    EXPECT_EQ(run(invocation(Command::STORE, {"//nope", (dir_ / "lib.a").string()}), out_, log_), 1);
    EXPECT_EQ(run(invocation(Command::STORE, {"//lib"}), out_, log_), 1);
}

TEST_F(DriverTest, MissingManifestFails) {
    Invocation inv = invocation(Command::KEYS);
    inv.config.manifest = (dir_ / "absent.json").string();
    EXPECT_EQ(run(inv, out_, log_), 1);
}

TEST_F(DriverTest, DiffReportsChangedKeys) {
    Invocation keys = invocation(Command::KEYS);
    keys.config.json = true;

    ASSERT_EQ(run(keys, out_, log_), 0);
    write_file(dir_ / "before.json", take_output());
    ASSERT_EQ(run(keys, out_, log_), 0);
    write_file(dir_ / "same.json", take_output());

    write_file(dir_ / "lib.src", "lib, edited");
    ASSERT_EQ(run(keys, out_, log_), 0);
    write_file(dir_ / "after.json", take_output());

    EXPECT_EQ(
        run(invocation(Command::DIFF, {(dir_ / "before.json").string(), (dir_ / "same.json").string()}), out_, log_),
        0);
    EXPECT_TRUE(take_output().empty());

    EXPECT_EQ(
        run(invocation(Command::DIFF, {(dir_ / "before.json").string(), (dir_ / "after.json").string()}), out_, log_),
        2);
    std::string text = take_output();
    EXPECT_NE(text.find("//lib: "), std::string::npos);
    EXPECT_EQ(text.find("//util: "), std::string::npos);
}
