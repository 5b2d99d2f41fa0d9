#pragma once

#include "stamp/filesystem.hpp"
#include "stamp/log.hpp"
#include "stamp/rule_key.hpp"
#include "stamp/sha1.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stamp {

class BuildRule;

/**
 * @brief Regimented computation of the SHA-1 key for a build rule.
 *
 * Conceptually this builds an ordered map: `RuleKeyBuilder(label).set_x(k1, v1)...set_x(kn, vn).build()`,
 * digested with a framing that maps each distinct vector <label, k1, ..., kn> 1:1 onto a byte
 * stream:
 *
 *     header := label SEP
 *     entry  := SEP key SEP value-frames
 *
 * where every value frame ends in SEP and lists add one closing SEP.
 *
 * Each schema (sequence of keys) must use a distinct label, and every key of the schema must be
 * set even when its value is absent; otherwise value bytes can alias key bytes. The setters take
 * optional values for exactly this reason.
 *
 * A builder belongs to one rule's computation. build() consumes it; any further use throws
 * std::logic_error.
 */
class RuleKeyBuilder {
public:
    RuleKeyBuilder(std::string_view rule_label, const FileSystem &fs, Log *log = nullptr);

    /**
     * @brief Starts the standard schema for a rule: its kind as header, then its name and the
     *        keys of its dependencies (ordered by name).
     *
     * Every dependency must already have its key computed.
     */
    static RuleKeyBuilder for_rule(const BuildRule &rule, const FileSystem &fs, Log *log = nullptr);

    RuleKeyBuilder(RuleKeyBuilder &&) noexcept = default;
    RuleKeyBuilder &operator=(RuleKeyBuilder &&) noexcept = default;
    RuleKeyBuilder(const RuleKeyBuilder &) = delete;
    RuleKeyBuilder &operator=(const RuleKeyBuilder &) = delete;

    RuleKeyBuilder &set_string(std::string_view key, std::optional<std::string_view> val);
    RuleKeyBuilder &set_bool(std::string_view key, bool val);

    /**
     * @brief Feeds the SHA-1 of the file's contents, never the contents themselves.
     *
     * An unreadable or missing file makes the resulting key non-idempotent.
     */
    RuleKeyBuilder &set_file(std::string_view key, const std::optional<std::filesystem::path> &val);

    /// Feeds the rendered nested key; a non-idempotent nested key poisons this one.
    RuleKeyBuilder &set_rule_key(std::string_view key, const std::optional<RuleKey> &val);
    RuleKeyBuilder &set_rule(std::string_view key, const BuildRule *val);

    /// Order is significant.
    RuleKeyBuilder &set_strings(std::string_view key, std::span<const std::string> vals);
    /// Order is not significant: values are sorted before they are fed.
    RuleKeyBuilder &set_string_set(std::string_view key, std::span<const std::string> vals);
    RuleKeyBuilder &set_rule_keys(std::string_view key, std::span<const RuleKey> vals);
    RuleKeyBuilder &set_files(std::string_view key, std::span<const std::filesystem::path> vals);

    /// The key to be built is non-idempotent if this is ever called with false.
    RuleKeyBuilder &merge_idempotence(bool idempotence);

    /// Marks the key non-idempotent, for rules whose results must never be cached.
    RuleKeyBuilder &non_idempotent();

    bool is_idempotent() const {
        return idempotent_;
    }

    /// Diagnostic trace elements; only recorded when the log is tracing.
    const std::vector<std::string> &trace() const {
        return trace_;
    }

    RuleKey build();

private:
    RuleKeyBuilder &feed(std::string_view bytes);
    RuleKeyBuilder &feed(const Sha1Digest &digest);
    RuleKeyBuilder &separate();
    RuleKeyBuilder &set_key(std::string_view section_label);

    RuleKeyBuilder &string_val(std::optional<std::string_view> s);
    RuleKeyBuilder &bool_val(bool b);
    RuleKeyBuilder &file_val(const std::optional<std::filesystem::path> &file);
    RuleKeyBuilder &rule_key_val(const std::optional<RuleKey> &rule_key);

    void check_live() const;
    bool tracing() const {
        return log_ && log_->tracing();
    }

    Sha1Hasher hasher_;
    const FileSystem *fs_;
    Log *log_;
    bool idempotent_ = true;
    bool built_ = false;
    std::vector<std::string> trace_;
};

} // namespace stamp
