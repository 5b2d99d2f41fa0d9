#include "stamp/manifest.hpp"

#include "stamp/mmap.hpp"
#include "stamp/rule.hpp"

#include <format>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace stamp {

namespace {

using Kinds = std::unordered_map<std::string, std::shared_ptr<const RuleKind>>;

Result<Kinds> parse_kinds(const json &j) {
    Kinds kinds;
    if (!j.is_object()) {
        return std::unexpected("Manifest \"kinds\" must be an object");
    }
    for (const auto &[label, schema] : j.items()) {
        if (!schema.is_array()) {
            return std::unexpected(std::format("Kind {}: schema must be an array", label));
        }
        auto kind = std::make_shared<RuleKind>();
        kind->label = label;
        std::unordered_set<std::string> seen;
        for (const auto &entry : schema) {
            auto key = entry.at("key").get<std::string>();
            auto type = entry.at("type").get<std::string>();
            auto shape = parse_attribute_shape(type);
            if (!shape) {
                return std::unexpected(std::format("Kind {}: unknown attribute type {} for {}", label, type, key));
            }
            if (!seen.insert(key).second) {
                return std::unexpected(std::format("Kind {}: attribute {} declared twice", label, key));
            }
            kind->schema.push_back({std::move(key), *shape});
        }
        kinds.emplace(label, std::move(kind));
    }
    return kinds;
}

Result<AttributeValue> to_attribute_value(const json &j) {
    if (j.is_string()) {
        return AttributeValue(j.get<std::string>());
    }
    if (j.is_boolean()) {
        return AttributeValue(j.get<bool>());
    }
    if (j.is_array()) {
        std::vector<std::string> items;
        items.reserve(j.size());
        for (const auto &item : j) {
            if (!item.is_string()) {
                return std::unexpected(std::format("list elements must be strings, got {}", item.dump()));
            }
            items.push_back(item.get<std::string>());
        }
        return AttributeValue(std::move(items));
    }
    return std::unexpected(std::format("unsupported value {}", j.dump()));
}

Result<void> parse_rule(const json &j, const Kinds &kinds, RuleGraph &graph) {
    auto name = j.at("name").get<std::string>();
    auto kind_label = j.at("kind").get<std::string>();
    auto kind = kinds.find(kind_label);
    if (kind == kinds.end()) {
        return std::unexpected(std::format("{}: unknown kind {}", name, kind_label));
    }

    auto rule = std::make_unique<ManifestRule>(name, kind->second);
    if (j.contains("cacheable")) {
        rule->set_cacheable(j.at("cacheable").get<bool>());
    }
    if (j.contains("attrs")) {
        for (const auto &[key, value] : j.at("attrs").items()) {
            auto attr = to_attribute_value(value);
            if (!attr) {
                return std::unexpected(std::format("{}: attribute {}: {}", name, key, attr.error()));
            }
            if (auto res = rule->set_attribute(key, std::move(*attr)); !res) {
                return res;
            }
        }
    }

    std::vector<std::string> deps;
    if (j.contains("deps")) {
        deps = j.at("deps").get<std::vector<std::string>>();
    }

    if (auto res = graph.add_rule(std::move(rule), std::move(deps)); !res) {
        return std::unexpected(res.error());
    }
    return {};
}

} // namespace

Result<void> parse_manifest_text(RuleGraph &graph, std::string_view text) {
    try {
        json manifest = json::parse(text);

        auto kinds = parse_kinds(manifest.value("kinds", json::object()));
        if (!kinds) {
            return std::unexpected(kinds.error());
        }
        for (const auto &rule : manifest.value("rules", json::array())) {
            if (auto res = parse_rule(rule, *kinds, graph); !res) {
                return res;
            }
        }
    } catch (const json::exception &err) {
        return std::unexpected(std::format("Malformed manifest: {}", err.what()));
    }
    return graph.link();
}

Result<void> parse_manifest(RuleGraph &graph, const std::filesystem::path &path) {
    auto file = MappedFile::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    return parse_manifest_text(graph, file->content());
}

} // namespace stamp
