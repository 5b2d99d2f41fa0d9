#pragma once

#include "stamp/filesystem.hpp"
#include "stamp/log.hpp"
#include "stamp/rule_key.hpp"
#include "stamp/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace stamp {

class RuleKeyBuilder;

/**
 * @brief A unit of build work: a name, a kind, dependencies and the state that determines its output.
 *
 * Subclasses describe their own state by appending it to a RuleKeyBuilder. The key is computed
 * once, after all dependencies have theirs, and is immutable afterwards.
 */
class BuildRule {
public:
    using Lookup = std::function<const BuildRule *(std::string_view name)>;

    BuildRule(std::string name, std::string type) : name_(std::move(name)), type_(std::move(type)) {
    }
    virtual ~BuildRule() = default;

    BuildRule(const BuildRule &) = delete;
    BuildRule &operator=(const BuildRule &) = delete;

    const std::string &name() const {
        return name_;
    }
    /// The rule kind; also the header label of the rule's key schema.
    const std::string &type() const {
        return type_;
    }
    const std::vector<const BuildRule *> &deps() const {
        return deps_;
    }

    /// Adds a dependency unless it is already present.
    void add_dep(const BuildRule *dep);

    /**
     * @brief Resolves rule names held in the rule's own attributes.
     *
     * Referenced rules become dependencies so that their keys are computed first.
     */
    virtual Result<void> resolve_references(const Lookup &lookup) {
        (void)lookup;
        return {};
    }

    /// Appends every key of this rule's schema, in a fixed order, whether or not a value is present.
    virtual void append_to_rule_key(RuleKeyBuilder &builder) const = 0;

    /// The files whose contents were digested into the key.
    virtual std::vector<std::filesystem::path> input_files() const = 0;

    /// Rules that are not cacheable always get a non-idempotent key.
    virtual bool is_cacheable() const {
        return true;
    }

    bool has_rule_key() const {
        return rule_key_.has_value();
    }

    /// @throws std::logic_error if the key has not been computed yet.
    const RuleKey &rule_key() const;

    /**
     * @brief Computes and stores the rule's key.
     * @throws std::logic_error if called twice or if a dependency has no key yet.
     */
    const RuleKey &compute_rule_key(const FileSystem &fs, Log *log = nullptr);

private:
    std::string name_;
    std::string type_;
    std::vector<const BuildRule *> deps_;
    std::optional<RuleKey> rule_key_;
};

enum class AttributeShape : uint8_t { STRING, BOOL, FILE, STRINGS, STRING_SET, FILES, RULE, RULES };

std::string_view to_string(AttributeShape shape);
std::optional<AttributeShape> parse_attribute_shape(std::string_view name);

struct AttributeSpec {
    std::string key;
    AttributeShape shape;
};

/// A rule kind: the label that heads its keys, and the ordered schema of its attributes.
struct RuleKind {
    std::string label;
    std::vector<AttributeSpec> schema;

    const AttributeSpec *find(std::string_view key) const;
};

/// STRING, FILE and RULE hold a string; BOOL a bool; the list shapes hold a vector.
using AttributeValue = std::variant<std::string, bool, std::vector<std::string>>;

/**
 * @brief A rule described entirely by data: a RuleKind plus attribute values.
 */
class ManifestRule : public BuildRule {
public:
    ManifestRule(std::string name, std::shared_ptr<const RuleKind> kind);

    /// Fails if the kind has no such key or the value does not fit the key's shape.
    Result<void> set_attribute(std::string_view key, AttributeValue value);
    const AttributeValue *attribute(std::string_view key) const;

    void set_cacheable(bool cacheable) {
        cacheable_ = cacheable;
    }
    bool is_cacheable() const override {
        return cacheable_;
    }

    Result<void> resolve_references(const Lookup &lookup) override;
    void append_to_rule_key(RuleKeyBuilder &builder) const override;
    std::vector<std::filesystem::path> input_files() const override;

private:
    std::shared_ptr<const RuleKind> kind_;
    std::unordered_map<std::string, AttributeValue> attributes_;
    std::unordered_map<std::string, std::vector<const BuildRule *>> references_;
    bool cacheable_ = true;
};

} // namespace stamp
