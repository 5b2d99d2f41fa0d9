// RuleKey value tests
//
// Ordering is total (non-idempotent first); equality never holds for non-idempotent keys.

#include "stamp/rule_key.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <unordered_set>
#include <vector>

using namespace stamp;

namespace {

RuleKey key_of(std::string_view s) {
    return RuleKey(sha1_of(s));
}

RuleKey key_with_first_byte(uint8_t b) {
    Sha1Digest d{};
    d[0] = b;
    return RuleKey(d);
}

} // namespace

TEST(RuleKeyTest, Idempotence) {
    EXPECT_TRUE(key_of("a").is_idempotent());
    EXPECT_FALSE(RuleKey::non_idempotent().is_idempotent());
}

TEST(RuleKeyTest, EqualityOfIdempotentKeys) {
    EXPECT_EQ(key_of("a"), key_of("a"));
    EXPECT_NE(key_of("a"), key_of("b"));
}

TEST(RuleKeyTest, NonIdempotentNeverEqual) {
    RuleKey n = RuleKey::non_idempotent();
    RuleKey copy = n;
    EXPECT_FALSE(n == copy);
    EXPECT_FALSE(n == n);
    EXPECT_FALSE(n == key_of("a"));
    EXPECT_FALSE(key_of("a") == n);
    EXPECT_TRUE(n != RuleKey::non_idempotent());
}

TEST(RuleKeyTest, OrderingPlacesNonIdempotentFirst) {
    RuleKey n = RuleKey::non_idempotent();
    EXPECT_TRUE(n < key_with_first_byte(0));
    EXPECT_TRUE(key_with_first_byte(0) > n);
    EXPECT_TRUE(std::is_eq(n <=> RuleKey::non_idempotent()));
    EXPECT_TRUE(key_with_first_byte(1) < key_with_first_byte(2));
    EXPECT_TRUE(key_with_first_byte(0x7f) < key_with_first_byte(0x80));
}

TEST(RuleKeyTest, SortingIsTotal) {
    std::vector<RuleKey> keys = {
        key_with_first_byte(0x90),
        RuleKey::non_idempotent(),
        key_with_first_byte(0x10),
        RuleKey::non_idempotent(),
        key_with_first_byte(0x50),
    };
    std::sort(keys.begin(), keys.end());

    EXPECT_FALSE(keys[0].is_idempotent());
    EXPECT_FALSE(keys[1].is_idempotent());
    EXPECT_EQ(keys[2], key_with_first_byte(0x10));
    EXPECT_EQ(keys[3], key_with_first_byte(0x50));
    EXPECT_EQ(keys[4], key_with_first_byte(0x90));
}

TEST(RuleKeyTest, Rendering) {
    EXPECT_EQ(key_of("abc").to_string(), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(key_of("abc").to_string(true), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(RuleKey::non_idempotent().to_string(), std::string(40, 'x'));
    EXPECT_EQ(RuleKey::non_idempotent().to_string(true), std::string(40, 'y'));
}

TEST(RuleKeyTest, Parse) {
    auto parsed = RuleKey::parse("a9993e364706816aba3e25717850c26c9cd0d89d");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, key_of("abc"));

    auto x = RuleKey::parse(std::string(40, 'x'));
    ASSERT_TRUE(x.has_value());
    EXPECT_FALSE(x->is_idempotent());

    auto y = RuleKey::parse(std::string(40, 'y'));
    ASSERT_TRUE(y.has_value());
    EXPECT_FALSE(y->is_idempotent());

    EXPECT_FALSE(RuleKey::parse(std::string(39, 'x') + "y").has_value());
    EXPECT_FALSE(RuleKey::parse("not a key").has_value());
}

TEST(RuleKeyTest, FilterDropsNonIdempotent) {
    EXPECT_FALSE(RuleKey::filter(RuleKey::non_idempotent()).has_value());
    ASSERT_TRUE(RuleKey::filter(key_of("a")).has_value());
    EXPECT_EQ(*RuleKey::filter(key_of("a")), key_of("a"));
}

TEST(RuleKeyTest, HashSetNeverFindsNonIdempotent) {
    std::unordered_set<RuleKey> set;
    set.insert(key_of("a"));
    set.insert(RuleKey::non_idempotent());

    EXPECT_TRUE(set.contains(key_of("a")));
    EXPECT_FALSE(set.contains(RuleKey::non_idempotent()));
    EXPECT_EQ(std::hash<RuleKey>{}(RuleKey::non_idempotent()), 0u);
}
