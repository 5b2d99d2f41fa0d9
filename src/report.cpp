#include "stamp/report.hpp"

#include "stamp/rule_key.hpp"

#include <format>
#include <map>

using json = nlohmann::json;

namespace stamp {

namespace {

Result<std::map<std::string, std::string>> read_report(const json &report, std::string_view which) {
    std::map<std::string, std::string> keys;
    try {
        for (const auto &[name, key] : report.at("rules").items()) {
            auto text = key.get<std::string>();
            auto parsed = RuleKey::parse(text);
            if (!parsed) {
                return std::unexpected(std::format("{} report, rule {}: {}", which, name, parsed.error()));
            }
            // Non-idempotent keys keep their x/y spelling so mangled reports still differ.
            keys.emplace(name, parsed->is_idempotent() ? parsed->to_string() : std::move(text));
        }
    } catch (const json::exception &err) {
        return std::unexpected(std::format("Malformed {} report: {}", which, err.what()));
    }
    return keys;
}

} // namespace

json make_key_report(const RuleGraph &graph, bool mangle_non_idempotent) {
    json rules = json::object();
    for (const auto &node : graph.nodes()) {
        rules[node.rule->name()] = node.rule->rule_key().to_string(mangle_non_idempotent);
    }
    json report;
    report["rules"] = std::move(rules);
    return report;
}

Result<std::vector<KeyDifference>> diff_key_reports(const json &before, const json &after) {
    auto a = read_report(before, "first");
    if (!a) {
        return std::unexpected(a.error());
    }
    auto b = read_report(after, "second");
    if (!b) {
        return std::unexpected(b.error());
    }

    std::vector<KeyDifference> diffs;
    auto ia = a->begin();
    auto ib = b->begin();
    while (ia != a->end() || ib != b->end()) {
        if (ib == b->end() || (ia != a->end() && ia->first < ib->first)) {
            diffs.push_back({ia->first, ia->second, std::nullopt});
            ++ia;
        } else if (ia == a->end() || ib->first < ia->first) {
            diffs.push_back({ib->first, std::nullopt, ib->second});
            ++ib;
        } else {
            if (ia->second != ib->second) {
                diffs.push_back({ia->first, ia->second, ib->second});
            }
            ++ia;
            ++ib;
        }
    }
    return diffs;
}

} // namespace stamp
