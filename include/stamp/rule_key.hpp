#pragma once

#include "stamp/sha1.hpp"
#include "stamp/utility.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace stamp {

/**
 * @brief Fingerprint of everything about a build rule that can affect its output.
 *
 * A key is either a SHA-1 digest (idempotent) or a digest-less marker (non-idempotent) for
 * rules whose state could not be captured. Keys are produced by RuleKeyBuilder::build() and
 * never change afterwards.
 *
 * Ordering and equality are different relations:
 * - `<=>` is total: non-idempotent < idempotent, idempotent keys by digest bytes, and all
 *   non-idempotent keys are equivalent to each other.
 * - `==` is false whenever either side is non-idempotent, even for a key and its copy.
 */
class RuleKey {
public:
    explicit RuleKey(const Sha1Digest &digest) : digest_(digest) {
    }

    static RuleKey non_idempotent() {
        return RuleKey();
    }

    /**
     * @brief Parses a rendered key.
     *
     * Accepts a 40-digit hex digest, or a run of 40 'x' or 'y' characters for a non-idempotent key.
     */
    static Result<RuleKey> parse(std::string_view text);

    /// Drops non-idempotent keys so callers never memoize them.
    static std::optional<RuleKey> filter(const RuleKey &key) {
        if (!key.is_idempotent())
            return std::nullopt;
        return key;
    }

    bool is_idempotent() const {
        return digest_.has_value();
    }

    const std::optional<Sha1Digest> &digest() const {
        return digest_;
    }

    /**
     * @brief Renders the key as hex, or as a run of 'x' characters if non-idempotent.
     *
     * When comparing two sets of rendered keys, one side is mangled (rendered with 'y') so that
     * non-idempotent keys never compare equal textually.
     */
    std::string to_string(bool mangle_non_idempotent = false) const;

    std::weak_ordering operator<=>(const RuleKey &other) const;
    bool operator==(const RuleKey &other) const;

private:
    RuleKey() = default;

    std::optional<Sha1Digest> digest_;
};

inline constexpr size_t RULE_KEY_STRING_SIZE = SHA1_DIGEST_SIZE * 2;

} // namespace stamp

template <>
struct std::hash<stamp::RuleKey> {
    size_t operator()(const stamp::RuleKey &key) const noexcept;
};
