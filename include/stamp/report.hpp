#pragma once

#include "stamp/graph.hpp"
#include "stamp/utility.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stamp {

/// `{"rules": {"<name>": "<rendered key>", ...}}`. Every rule must already be keyed.
nlohmann::json make_key_report(const RuleGraph &graph, bool mangle_non_idempotent = false);

struct KeyDifference {
    std::string rule;
    std::optional<std::string> before; ///< nullopt if the rule is missing from the first report.
    std::optional<std::string> after;  ///< nullopt if the rule is missing from the second report.
};

/**
 * @brief Lists rules whose keys differ between two reports, in rule-name order.
 *
 * Comparison is textual; non-idempotent keys only compare unequal if one report was mangled.
 */
Result<std::vector<KeyDifference>> diff_key_reports(const nlohmann::json &before, const nlohmann::json &after);

} // namespace stamp
