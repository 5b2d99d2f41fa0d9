#include "stamp/rule.hpp"

#include "stamp/rule_key_builder.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <stdexcept>

namespace stamp {

void BuildRule::add_dep(const BuildRule *dep) {
    if (std::ranges::find(deps_, dep) == deps_.end()) {
        deps_.push_back(dep);
    }
}

const RuleKey &BuildRule::rule_key() const {
    if (!rule_key_) {
        throw std::logic_error(std::format("Rule key of {} requested before it was computed", name_));
    }
    return *rule_key_;
}

const RuleKey &BuildRule::compute_rule_key(const FileSystem &fs, Log *log) {
    if (rule_key_) {
        throw std::logic_error(std::format("Rule key of {} computed twice", name_));
    }
    RuleKeyBuilder builder = RuleKeyBuilder::for_rule(*this, fs, log);
    append_to_rule_key(builder);
    if (!is_cacheable()) {
        builder.non_idempotent();
    }
    rule_key_ = builder.build();
    return *rule_key_;
}

namespace {

constexpr std::array<std::pair<AttributeShape, std::string_view>, 8> SHAPE_NAMES = {{
    {AttributeShape::STRING, "string"},
    {AttributeShape::BOOL, "bool"},
    {AttributeShape::FILE, "file"},
    {AttributeShape::STRINGS, "strings"},
    {AttributeShape::STRING_SET, "string_set"},
    {AttributeShape::FILES, "files"},
    {AttributeShape::RULE, "rule"},
    {AttributeShape::RULES, "rules"},
}};

bool fits(AttributeShape shape, const AttributeValue &value) {
    switch (shape) {
    case AttributeShape::STRING:
    case AttributeShape::FILE:
    case AttributeShape::RULE:
        return std::holds_alternative<std::string>(value);
    case AttributeShape::BOOL:
        return std::holds_alternative<bool>(value);
    case AttributeShape::STRINGS:
    case AttributeShape::STRING_SET:
    case AttributeShape::FILES:
    case AttributeShape::RULES:
        return std::holds_alternative<std::vector<std::string>>(value);
    }
    return false;
}

} // namespace

std::string_view to_string(AttributeShape shape) {
    for (const auto &[s, name] : SHAPE_NAMES) {
        if (s == shape)
            return name;
    }
    return "unknown";
}

std::optional<AttributeShape> parse_attribute_shape(std::string_view name) {
    for (const auto &[shape, n] : SHAPE_NAMES) {
        if (n == name)
            return shape;
    }
    return std::nullopt;
}

const AttributeSpec *RuleKind::find(std::string_view key) const {
    auto it = std::ranges::find(schema, key, &AttributeSpec::key);
    return it == schema.end() ? nullptr : &*it;
}

ManifestRule::ManifestRule(std::string name, std::shared_ptr<const RuleKind> kind)
    : BuildRule(std::move(name), kind->label), kind_(std::move(kind)) {
}

Result<void> ManifestRule::set_attribute(std::string_view key, AttributeValue value) {
    const AttributeSpec *spec = kind_->find(key);
    if (!spec) {
        return std::unexpected(std::format("{}: kind {} has no attribute {}", name(), kind_->label, key));
    }
    if (!fits(spec->shape, value)) {
        return std::unexpected(
            std::format("{}: attribute {} expects a value of type {}", name(), key, to_string(spec->shape)));
    }
    attributes_.insert_or_assign(std::string(key), std::move(value));
    return {};
}

const AttributeValue *ManifestRule::attribute(std::string_view key) const {
    if (auto it = attributes_.find(std::string(key)); it != attributes_.end()) {
        return &it->second;
    }
    return nullptr;
}

Result<void> ManifestRule::resolve_references(const Lookup &lookup) {
    for (const auto &spec : kind_->schema) {
        if (spec.shape != AttributeShape::RULE && spec.shape != AttributeShape::RULES)
            continue;
        const AttributeValue *value = attribute(spec.key);
        if (!value)
            continue;

        std::vector<std::string> names;
        if (const auto *one = std::get_if<std::string>(value)) {
            names.push_back(*one);
        } else {
            names = std::get<std::vector<std::string>>(*value);
        }

        std::vector<const BuildRule *> resolved;
        resolved.reserve(names.size());
        for (const auto &target : names) {
            const BuildRule *rule = lookup(target);
            if (!rule) {
                return std::unexpected(std::format("{}: attribute {} refers to unknown rule {}", name(), spec.key, target));
            }
            add_dep(rule);
            resolved.push_back(rule);
        }
        references_.insert_or_assign(spec.key, std::move(resolved));
    }
    return {};
}

void ManifestRule::append_to_rule_key(RuleKeyBuilder &builder) const {
    static const std::vector<std::string> NO_STRINGS;

    for (const auto &spec : kind_->schema) {
        const AttributeValue *value = attribute(spec.key);
        const auto *str = value ? std::get_if<std::string>(value) : nullptr;
        const auto *list = value ? std::get_if<std::vector<std::string>>(value) : nullptr;

        switch (spec.shape) {
        case AttributeShape::STRING:
            builder.set_string(spec.key, str ? std::optional<std::string_view>(*str) : std::nullopt);
            break;
        case AttributeShape::BOOL:
            builder.set_bool(spec.key, value && std::get<bool>(*value));
            break;
        case AttributeShape::FILE:
            builder.set_file(spec.key, str ? std::optional<std::filesystem::path>(*str) : std::nullopt);
            break;
        case AttributeShape::STRINGS:
            builder.set_strings(spec.key, list ? *list : NO_STRINGS);
            break;
        case AttributeShape::STRING_SET:
            builder.set_string_set(spec.key, list ? *list : NO_STRINGS);
            break;
        case AttributeShape::FILES: {
            std::vector<std::filesystem::path> files;
            if (list)
                files.assign(list->begin(), list->end());
            builder.set_files(spec.key, files);
            break;
        }
        case AttributeShape::RULE: {
            auto it = references_.find(spec.key);
            builder.set_rule(spec.key, it != references_.end() && !it->second.empty() ? it->second.front() : nullptr);
            break;
        }
        case AttributeShape::RULES: {
            std::vector<RuleKey> keys;
            if (auto it = references_.find(spec.key); it != references_.end()) {
                for (const BuildRule *rule : it->second) {
                    keys.push_back(rule->rule_key());
                }
            }
            builder.set_rule_keys(spec.key, keys);
            break;
        }
        }
    }
}

std::vector<std::filesystem::path> ManifestRule::input_files() const {
    std::vector<std::filesystem::path> files;
    for (const auto &spec : kind_->schema) {
        const AttributeValue *value = attribute(spec.key);
        if (!value)
            continue;
        if (spec.shape == AttributeShape::FILE) {
            files.emplace_back(std::get<std::string>(*value));
        } else if (spec.shape == AttributeShape::FILES) {
            for (const auto &f : std::get<std::vector<std::string>>(*value)) {
                files.emplace_back(f);
            }
        }
    }
    return files;
}

} // namespace stamp
