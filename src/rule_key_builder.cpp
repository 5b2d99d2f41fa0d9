#include "stamp/rule_key_builder.hpp"

#include "stamp/rule.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace stamp {

namespace {

constexpr uint8_t SEPARATOR = '\0';

} // namespace

RuleKeyBuilder::RuleKeyBuilder(std::string_view rule_label, const FileSystem &fs, Log *log) : fs_(&fs), log_(log) {
    if (tracing()) {
        trace_.push_back(std::format("header({}):", rule_label));
    }
    feed(rule_label).separate();
}

RuleKeyBuilder RuleKeyBuilder::for_rule(const BuildRule &rule, const FileSystem &fs, Log *log) {
    std::vector<const BuildRule *> deps = rule.deps();
    std::ranges::sort(deps, [](const BuildRule *a, const BuildRule *b) { return a->name() < b->name(); });

    std::vector<RuleKey> dep_keys;
    dep_keys.reserve(deps.size());
    for (const BuildRule *dep : deps) {
        if (!dep->has_rule_key()) {
            throw std::logic_error(
                std::format("Key of {} requested before its dependency {} was keyed", rule.name(), dep->name()));
        }
        dep_keys.push_back(dep->rule_key());
    }

    RuleKeyBuilder builder(rule.type(), fs, log);
    // Keyed as "stamp.name" rather than "name" in case a rule kind has its own "name" attribute.
    builder.set_string("stamp.name", rule.name());
    builder.set_rule_keys("deps", dep_keys);
    return builder;
}

void RuleKeyBuilder::check_live() const {
    if (built_) {
        throw std::logic_error("RuleKeyBuilder used after build()");
    }
}

RuleKeyBuilder &RuleKeyBuilder::feed(std::string_view bytes) {
    hasher_.update(bytes);
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::feed(const Sha1Digest &digest) {
    hasher_.update(digest);
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::separate() {
    hasher_.update(SEPARATOR);
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::set_key(std::string_view section_label) {
    check_live();
    if (tracing()) {
        trace_.push_back(std::format(":key({}):", section_label));
    }
    return separate().feed(section_label).separate();
}

RuleKeyBuilder &RuleKeyBuilder::string_val(std::optional<std::string_view> s) {
    if (s) {
        if (tracing()) {
            trace_.push_back(std::format("string(\"{}\"):", *s));
        }
        feed(*s);
    }
    return separate();
}

RuleKeyBuilder &RuleKeyBuilder::bool_val(bool b) {
    if (tracing()) {
        trace_.push_back(std::format("boolean(\"{}\"):", b ? "true" : "false"));
    }
    return feed(b ? "t" : "f").separate();
}

RuleKeyBuilder &RuleKeyBuilder::file_val(const std::optional<std::filesystem::path> &file) {
    if (file) {
        // Feed a separate digest of the contents so SEPARATOR never has to be escaped inside file data.
        auto digest = fs_->content_digest(*file);
        if (digest) {
            if (tracing()) {
                trace_.push_back(std::format("file(path=\"{}\", sha1={}):", file->string(), to_hex(*digest)));
            }
            feed(*digest);
        } else {
            // Nonexistent or unreadable: produce a key that prevents accidental caching.
            if (tracing()) {
                trace_.push_back(std::format("file(path=\"{}\", sha1=random):", file->string()));
            }
            if (log_) {
                log_->trace("{}", digest.error());
            }
            non_idempotent();
        }
    }
    return separate();
}

RuleKeyBuilder &RuleKeyBuilder::rule_key_val(const std::optional<RuleKey> &rule_key) {
    if (rule_key) {
        std::string rendered = rule_key->to_string();
        if (tracing()) {
            trace_.push_back(
                std::format("{}ruleKey(sha1={}):", rule_key->is_idempotent() ? "" : "non-idempotent ", rendered));
        }
        feed(rendered).merge_idempotence(rule_key->is_idempotent());
    }
    return separate();
}

RuleKeyBuilder &RuleKeyBuilder::set_string(std::string_view key, std::optional<std::string_view> val) {
    return set_key(key).string_val(val);
}

RuleKeyBuilder &RuleKeyBuilder::set_bool(std::string_view key, bool val) {
    return set_key(key).bool_val(val);
}

RuleKeyBuilder &RuleKeyBuilder::set_file(std::string_view key, const std::optional<std::filesystem::path> &val) {
    return set_key(key).file_val(val);
}

RuleKeyBuilder &RuleKeyBuilder::set_rule_key(std::string_view key, const std::optional<RuleKey> &val) {
    return set_key(key).rule_key_val(val);
}

RuleKeyBuilder &RuleKeyBuilder::set_rule(std::string_view key, const BuildRule *val) {
    if (!val) {
        return set_rule_key(key, std::nullopt);
    }
    return set_rule_key(key, val->rule_key());
}

RuleKeyBuilder &RuleKeyBuilder::set_strings(std::string_view key, std::span<const std::string> vals) {
    set_key(key);
    for (const auto &s : vals) {
        string_val(s);
    }
    return separate();
}

RuleKeyBuilder &RuleKeyBuilder::set_string_set(std::string_view key, std::span<const std::string> vals) {
    std::vector<std::string_view> sorted(vals.begin(), vals.end());
    std::ranges::sort(sorted);
    sorted.erase(std::ranges::unique(sorted).begin(), sorted.end());
    set_key(key);
    for (std::string_view s : sorted) {
        string_val(s);
    }
    return separate();
}

RuleKeyBuilder &RuleKeyBuilder::set_rule_keys(std::string_view key, std::span<const RuleKey> vals) {
    set_key(key);
    for (const auto &rule_key : vals) {
        rule_key_val(rule_key);
    }
    return separate();
}

RuleKeyBuilder &RuleKeyBuilder::set_files(std::string_view key, std::span<const std::filesystem::path> vals) {
    set_key(key);
    for (const auto &file : vals) {
        file_val(file);
    }
    return separate();
}

RuleKeyBuilder &RuleKeyBuilder::merge_idempotence(bool idempotence) {
    check_live();
    if (!idempotence) {
        idempotent_ = false;
    }
    return *this;
}

RuleKeyBuilder &RuleKeyBuilder::non_idempotent() {
    check_live();
    if (tracing()) {
        trace_.push_back("nonIdempotent()");
    }
    return merge_idempotence(false);
}

RuleKey RuleKeyBuilder::build() {
    check_live();
    built_ = true;
    Sha1Digest digest = hasher_.finish();
    RuleKey rule_key = idempotent_ ? RuleKey(digest) : RuleKey::non_idempotent();
    if (tracing()) {
        std::string joined;
        for (const auto &elm : trace_) {
            joined += elm;
        }
        log_->trace("{}RuleKey {}={}", rule_key.is_idempotent() ? "" : "non-idempotent ", rule_key.to_string(), joined);
    }
    return rule_key;
}

} // namespace stamp
