#include "stamp/cache_validity.hpp"

#include "stamp/sha1.hpp"

#include <set>
#include <string>

namespace stamp {

CacheVerdict check_cache_validity(CacheStatus &status, const BuildRule &rule) {
    CacheVerdict verdict;
    verdict.self_cached = status.is_cached(rule);
    verdict.inputs_valid = status.inputs_still_valid(rule);
    verdict.has_uncached_descendants = status.has_uncached_descendants(rule);
    return verdict;
}

bool CacheValidityOracle::is_cached(const BuildRule &rule) {
    const RuleKey &key = rule.rule_key();
    if (!key.is_idempotent()) {
        return false;
    }
    auto present = cache_.has_artifact(key);
    if (!present) {
        log_.warn("{}: cache probe failed: {}", rule.name(), present.error());
        return false;
    }
    return *present;
}

bool CacheValidityOracle::inputs_still_valid(const BuildRule &rule) {
    const RuleKey &key = rule.rule_key();
    if (!key.is_idempotent()) {
        return false;
    }

    auto metadata = cache_.fetch_metadata(key);
    if (!metadata) {
        log_.warn("{}: reading cache metadata failed: {}", rule.name(), metadata.error());
        return false;
    }
    if (!*metadata) {
        return false;
    }
    const auto &recorded = (*metadata)->inputs;

    std::set<std::string> declared;
    for (const auto &input : rule.input_files()) {
        declared.insert(input.generic_string());
    }
    if (declared.size() != recorded.size()) {
        return false;
    }

    for (const auto &path : declared) {
        auto it = recorded.find(path);
        if (it == recorded.end()) {
            return false;
        }
        auto digest = fs_.content_digest(path);
        if (!digest) {
            log_.warn("{}: cannot digest input {}: {}", rule.name(), path, digest.error());
            return false;
        }
        if (to_hex(*digest) != it->second) {
            log_.trace("{}: input {} changed since it was cached", rule.name(), path);
            return false;
        }
    }
    return true;
}

bool CacheValidityOracle::valid_in_itself(const BuildRule &rule) {
    return is_cached(rule) && inputs_still_valid(rule);
}

bool CacheValidityOracle::has_uncached_descendants(const BuildRule &rule) {
    {
        std::lock_guard lock(memo_mtx_);
        if (auto it = uncached_descendants_.find(&rule); it != uncached_descendants_.end()) {
            return it->second;
        }
    }

    // Not locked across the recursion; concurrent callers may compute the same entry twice.
    bool result = false;
    for (const BuildRule *dep : rule.deps()) {
        if (!valid_in_itself(*dep) || has_uncached_descendants(*dep)) {
            result = true;
            break;
        }
    }

    std::lock_guard lock(memo_mtx_);
    uncached_descendants_.emplace(&rule, result);
    return result;
}

} // namespace stamp
