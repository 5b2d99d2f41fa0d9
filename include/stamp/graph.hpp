#pragma once

#include "stamp/filesystem.hpp"
#include "stamp/log.hpp"
#include "stamp/rule.hpp"
#include "stamp/utility.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stamp {

/**
 * @brief Owns the build rules and the dependency edges between them.
 *
 * Rules are added with the names of their dependencies; link() resolves the names into edges
 * once every rule is present.
 */
class RuleGraph {
public:
    struct Node {
        std::unique_ptr<BuildRule> rule;
        std::vector<std::string> dep_names;
        std::vector<size_t> out_edges; ///< Indices of nodes that depend on this node.
    };

    /**
     * @brief Adds a rule to the graph.
     * @return The index of the added rule, or an error if a rule with that name already exists.
     */
    Result<size_t> add_rule(std::unique_ptr<BuildRule> rule, std::vector<std::string> dep_names = {});

    /// Resolves dependency names and rule references; fails on unknown names.
    Result<void> link();

    const BuildRule *find(std::string_view name) const;
    BuildRule *find(std::string_view name);

    const std::vector<Node> &nodes() const {
        return nodes_;
    }

    /**
     * @brief Performs a topological sort of the graph.
     * @return Node indices with dependencies first, or an error if a cycle is detected.
     */
    Result<std::vector<size_t>> topo_sort() const;

    /// Computes every rule's key, leaves first.
    Result<void> compute_rule_keys(const FileSystem &fs, Log *log = nullptr);

private:
    std::vector<Node> nodes_;
    std::unordered_map<std::string, size_t> index_;
    bool linked_ = false;
};

} // namespace stamp
