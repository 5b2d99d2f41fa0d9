#include "stamp/rule_key.hpp"

#include <algorithm>
#include <cstring>
#include <format>

namespace stamp {

namespace {

constexpr char NON_IDEMPOTENT_CHAR = 'x';
constexpr char MANGLED_NON_IDEMPOTENT_CHAR = 'y';

} // namespace

Result<RuleKey> RuleKey::parse(std::string_view text) {
    if (text.size() == RULE_KEY_STRING_SIZE &&
        (std::ranges::all_of(text, [](char c) { return c == NON_IDEMPOTENT_CHAR; }) ||
         std::ranges::all_of(text, [](char c) { return c == MANGLED_NON_IDEMPOTENT_CHAR; }))) {
        return RuleKey::non_idempotent();
    }
    auto digest = digest_from_hex(text);
    if (!digest) {
        return std::unexpected(std::format("Invalid rule key: {}", digest.error()));
    }
    return RuleKey(*digest);
}

std::string RuleKey::to_string(bool mangle_non_idempotent) const {
    if (!is_idempotent()) {
        return std::string(RULE_KEY_STRING_SIZE,
                           mangle_non_idempotent ? MANGLED_NON_IDEMPOTENT_CHAR : NON_IDEMPOTENT_CHAR);
    }
    return to_hex(*digest_);
}

std::weak_ordering RuleKey::operator<=>(const RuleKey &other) const {
    if (!is_idempotent()) {
        return other.is_idempotent() ? std::weak_ordering::less : std::weak_ordering::equivalent;
    }
    if (!other.is_idempotent()) {
        return std::weak_ordering::greater;
    }
    int cmp = std::memcmp(digest_->data(), other.digest_->data(), SHA1_DIGEST_SIZE);
    if (cmp < 0)
        return std::weak_ordering::less;
    if (cmp > 0)
        return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}

bool RuleKey::operator==(const RuleKey &other) const {
    if (!is_idempotent() || !other.is_idempotent()) {
        return false;
    }
    return *digest_ == *other.digest_;
}

} // namespace stamp

size_t std::hash<stamp::RuleKey>::operator()(const stamp::RuleKey &key) const noexcept {
    if (!key.is_idempotent()) {
        return 0;
    }
    size_t h = 0;
    std::memcpy(&h, key.digest()->data(), sizeof(h));
    return h;
}
