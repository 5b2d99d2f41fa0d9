// Cache validity tests
//
// The combination logic is exercised with a fixed-answer CacheStatus; the oracle itself is
// exercised against a real artifact directory and an in-memory filesystem.

#include "stamp/cache_validity.hpp"

#include "stamp/graph.hpp"
#include "test_doubles.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace stamp;
using stamp::test_support::FakeCacheStatus;
using stamp::test_support::FakeFileSystem;
using stamp::test_support::FakeLibraryRule;
using stamp::test_support::ScratchDir;

// ============================================================================
// Combination logic
// ============================================================================

TEST(CacheVerdictTest, OnlyAllThreeAllowSkipping) {
    FakeLibraryRule rule("//a", {});
    for (int bits = 0; bits < 8; ++bits) {
        bool cached = bits & 1;
        bool inputs = bits & 2;
        bool uncached_descendants = bits & 4;
        FakeCacheStatus status(cached, inputs, uncached_descendants);

        CacheVerdict verdict = check_cache_validity(status, rule);
        EXPECT_EQ(verdict.self_cached, cached);
        EXPECT_EQ(verdict.inputs_valid, inputs);
        EXPECT_EQ(verdict.has_uncached_descendants, uncached_descendants);
        EXPECT_EQ(verdict.can_skip(), cached && inputs && !uncached_descendants) << "bits=" << bits;
    }
}

TEST(CacheVerdictTest, DefaultVerdictRebuilds) {
    EXPECT_FALSE(CacheVerdict{}.can_skip());
}

// ============================================================================
// Oracle
// ============================================================================

class CacheValidityOracleTest : public ::testing::Test {
protected:
    ScratchDir dir_;
    FakeFileSystem fs_;
    DirectoryArtifactCache cache_{dir_.path() / "cache"};
    std::ostringstream log_out_;
    Log log_{Verbosity::NORMAL, log_out_};
    RuleGraph graph_;

    void SetUp() override {
        fs_.write("app.src", "app");
        fs_.write("lib.src", "lib");
        fs_.write("util.src", "util");
        add("//app", {"app.src"}, {"//lib"});
        add("//lib", {"lib.src"}, {"//util"});
        add("//util", {"util.src"});
        ASSERT_TRUE(graph_.compute_rule_keys(fs_).has_value());
    }

    void add(const std::string &name, std::vector<std::string> srcs, std::vector<std::string> deps = {}) {
        ASSERT_TRUE(graph_.add_rule(std::make_unique<FakeLibraryRule>(name, std::move(srcs)), std::move(deps)));
    }

    const BuildRule &rule(const std::string &name) {
        return *graph_.find(name);
    }

    void store(const std::string &name) {
        auto metadata = capture_metadata(rule(name), fs_);
        ASSERT_TRUE(metadata.has_value()) << metadata.error();
        ASSERT_TRUE(cache_.store(rule(name).rule_key(), "artifact of " + name, *metadata));
    }

    void store_all() {
        for (const auto &node : graph_.nodes()) {
            store(node.rule->name());
        }
    }
};

TEST_F(CacheValidityOracleTest, EmptyCacheRebuildsEverything) {
    CacheValidityOracle oracle(cache_, fs_, log_);
    for (const auto &node : graph_.nodes()) {
        CacheVerdict verdict = check_cache_validity(oracle, *node.rule);
        EXPECT_FALSE(verdict.self_cached);
        EXPECT_FALSE(verdict.inputs_valid);
        EXPECT_FALSE(verdict.can_skip());
    }
    CacheValidityOracle fresh(cache_, fs_, log_);
    EXPECT_FALSE(fresh.has_uncached_descendants(rule("//util")));
    EXPECT_TRUE(fresh.has_uncached_descendants(rule("//lib")));
    EXPECT_TRUE(fresh.has_uncached_descendants(rule("//app")));
}

TEST_F(CacheValidityOracleTest, FullyCachedGraphSkipsEverything) {
    store_all();
    CacheValidityOracle oracle(cache_, fs_, log_);
    for (const auto &node : graph_.nodes()) {
        EXPECT_TRUE(check_cache_validity(oracle, *node.rule).can_skip()) << node.rule->name();
    }
}

TEST_F(CacheValidityOracleTest, UncachedLeafMarksAllAncestors) {
    store("//app");
    store("//lib");
    CacheValidityOracle oracle(cache_, fs_, log_);

    EXPECT_FALSE(oracle.has_uncached_descendants(rule("//util")));
    EXPECT_TRUE(oracle.has_uncached_descendants(rule("//lib")));
    EXPECT_TRUE(oracle.has_uncached_descendants(rule("//app")));
    EXPECT_TRUE(oracle.is_cached(rule("//app")));
    EXPECT_FALSE(check_cache_validity(oracle, rule("//app")).can_skip());
}

TEST_F(CacheValidityOracleTest, HandEditedInputInvalidatesCachedArtifact) {
    // //lib is cached, its source is then edited on disk, and its dependency //util was never cached.
    store("//app");
    store("//lib");
    fs_.write("lib.src", "lib, edited after caching");

    CacheValidityOracle oracle(cache_, fs_, log_);
    CacheVerdict verdict = check_cache_validity(oracle, rule("//lib"));
    EXPECT_TRUE(verdict.self_cached);
    EXPECT_FALSE(verdict.inputs_valid);
    EXPECT_TRUE(verdict.has_uncached_descendants);
    EXPECT_FALSE(verdict.can_skip());
}

TEST_F(CacheValidityOracleTest, InputDriftIsIndependentOfSelfCached) {
    store_all();
    fs_.write("util.src", "drifted");

    CacheValidityOracle oracle(cache_, fs_, log_);
    EXPECT_TRUE(oracle.is_cached(rule("//util")));
    EXPECT_FALSE(oracle.inputs_still_valid(rule("//util")));
    EXPECT_TRUE(oracle.has_uncached_descendants(rule("//lib")));
    EXPECT_TRUE(oracle.has_uncached_descendants(rule("//app")));
}

TEST_F(CacheValidityOracleTest, MissingInputIsInvalidNotFatal) {
    store_all();
    fs_.remove("util.src");

    CacheValidityOracle oracle(cache_, fs_, log_);
    EXPECT_FALSE(oracle.inputs_still_valid(rule("//util")));
    EXPECT_NE(log_out_.str().find("cannot digest input util.src"), std::string::npos);
}

TEST_F(CacheValidityOracleTest, MalformedMetadataIsInvalidAndLogged) {
    store_all();
    const std::string hex = rule("//util").rule_key().to_string();
    std::ofstream(cache_.root() / hex.substr(0, 2) / (hex + ".json"), std::ios::trunc) << "[";

    CacheValidityOracle oracle(cache_, fs_, log_);
    EXPECT_TRUE(oracle.is_cached(rule("//util")));
    EXPECT_FALSE(oracle.inputs_still_valid(rule("//util")));
    EXPECT_NE(log_out_.str().find("warning: //util: reading cache metadata failed"), std::string::npos);
}

TEST_F(CacheValidityOracleTest, NonIdempotentRuleIsNeverCached) {
    auto volatile_rule = std::make_unique<FakeLibraryRule>("//volatile", std::vector<std::string>{"util.src"});
    volatile_rule->cacheable = false;
    volatile_rule->compute_rule_key(fs_);

    CacheValidityOracle oracle(cache_, fs_, log_);
    CacheVerdict verdict = check_cache_validity(oracle, *volatile_rule);
    EXPECT_FALSE(verdict.self_cached);
    EXPECT_FALSE(verdict.inputs_valid);
    EXPECT_FALSE(verdict.has_uncached_descendants);
    EXPECT_FALSE(verdict.can_skip());
}

TEST_F(CacheValidityOracleTest, DescendantResultsAreMemoizedPerOracle) {
    store_all();
    CacheValidityOracle oracle(cache_, fs_, log_);
    EXPECT_FALSE(oracle.has_uncached_descendants(rule("//app")));
    int calls_after_first = fs_.digest_calls.load();

    // Drift after the first evaluation is not seen by the same oracle...
    fs_.write("util.src", "drifted");
    EXPECT_FALSE(oracle.has_uncached_descendants(rule("//app")));
    EXPECT_EQ(fs_.digest_calls.load(), calls_after_first);

    // ...but a new build invocation sees it.
    CacheValidityOracle next(cache_, fs_, log_);
    EXPECT_TRUE(next.has_uncached_descendants(rule("//app")));
}
