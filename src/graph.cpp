#include "stamp/graph.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace stamp {

Result<size_t> RuleGraph::add_rule(std::unique_ptr<BuildRule> rule, std::vector<std::string> dep_names) {
    if (linked_) {
        return std::unexpected(std::format("Cannot add {} after the graph was linked", rule->name()));
    }
    if (index_.contains(rule->name())) {
        return std::unexpected(std::format("Duplicate rule: {}", rule->name()));
    }

    size_t id = nodes_.size();
    index_.emplace(rule->name(), id);
    nodes_.push_back({std::move(rule), std::move(dep_names), {}});
    return id;
}

const BuildRule *RuleGraph::find(std::string_view name) const {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return nodes_[it->second].rule.get();
    }
    return nullptr;
}

BuildRule *RuleGraph::find(std::string_view name) {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return nodes_[it->second].rule.get();
    }
    return nullptr;
}

Result<void> RuleGraph::link() {
    if (linked_) {
        return {};
    }

    const BuildRule::Lookup lookup = [this](std::string_view name) -> const BuildRule * {
        return std::as_const(*this).find(name);
    };

    for (auto &node : nodes_) {
        for (const auto &dep_name : node.dep_names) {
            const BuildRule *dep = lookup(dep_name);
            if (!dep) {
                return std::unexpected(std::format("{} depends on unknown rule {}", node.rule->name(), dep_name));
            }
            if (dep == node.rule.get()) {
                return std::unexpected(std::format("{} depends on itself", dep_name));
            }
            node.rule->add_dep(dep);
        }
        if (auto res = node.rule->resolve_references(lookup); !res) {
            return res;
        }
    }

    for (size_t i = 0; i < nodes_.size(); ++i) {
        for (const BuildRule *dep : nodes_[i].rule->deps()) {
            nodes_[index_.at(dep->name())].out_edges.push_back(i);
        }
    }

    linked_ = true;
    return {};
}

Result<std::vector<size_t>> RuleGraph::topo_sort() const {
    // Kahn's algorithm: a rule becomes ready once all of its dependencies are ordered.
    std::vector<size_t> pending(nodes_.size());
    std::vector<size_t> order;
    order.reserve(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i) {
        pending[i] = nodes_[i].rule->deps().size();
        if (pending[i] == 0)
            order.push_back(i);
    }

    for (size_t next = 0; next < order.size(); ++next) {
        for (size_t dependent : nodes_[order[next]].out_edges) {
            if (--pending[dependent] == 0)
                order.push_back(dependent);
        }
    }

    if (order.size() != nodes_.size()) {
        auto stuck = std::ranges::find_if(pending, [](size_t n) { return n != 0; });
        return std::unexpected(std::format("Cycle detected in the rule graph at: {}",
                                           nodes_[static_cast<size_t>(stuck - pending.begin())].rule->name()));
    }
    return order;
}

Result<void> RuleGraph::compute_rule_keys(const FileSystem &fs, Log *log) {
    if (auto res = link(); !res) {
        return res;
    }
    auto order = topo_sort();
    if (!order) {
        return std::unexpected(order.error());
    }
    for (size_t idx : *order) {
        BuildRule &rule = *nodes_[idx].rule;
        if (!rule.has_rule_key()) {
            rule.compute_rule_key(fs, log);
        }
    }
    return {};
}

} // namespace stamp
