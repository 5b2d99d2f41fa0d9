#pragma once

#include "stamp/graph.hpp"
#include "stamp/utility.hpp"

#include <filesystem>
#include <string_view>

namespace stamp {

/**
 * @brief Populates a rule graph from a JSON manifest.
 *
 * The manifest declares rule kinds (a label and an ordered attribute schema) and rules of those
 * kinds:
 *
 *     {
 *       "kinds": {"cxx_library": [{"key": "srcs", "type": "files"}, ...]},
 *       "rules": [{"name": "//lib:a", "kind": "cxx_library", "deps": [...], "cacheable": true,
 *                  "attrs": {"srcs": ["a.cc"]}}]
 *     }
 *
 * The graph is linked before returning.
 */
Result<void> parse_manifest(RuleGraph &graph, const std::filesystem::path &path);

/// As parse_manifest, from manifest text already in memory.
Result<void> parse_manifest_text(RuleGraph &graph, std::string_view text);

} // namespace stamp
