#pragma once

#include "stamp/artifact_cache.hpp"
#include "stamp/filesystem.hpp"
#include "stamp/log.hpp"
#include "stamp/rule.hpp"

#include <mutex>
#include <unordered_map>

namespace stamp {

/**
 * @brief The three independent cache questions asked about a rule.
 *
 * All predicates are total: probe failures answer false, which forces a rebuild.
 */
class CacheStatus {
public:
    virtual ~CacheStatus() = default;

    /// An artifact exists for the rule's key.
    virtual bool is_cached(const BuildRule &rule) = 0;
    /// The rule's input files still match what the cached artifact was built from.
    virtual bool inputs_still_valid(const BuildRule &rule) = 0;
    /// Some transitive dependency fails its own cache-validity check.
    virtual bool has_uncached_descendants(const BuildRule &rule) = 0;
};

struct CacheVerdict {
    bool self_cached = false;
    bool inputs_valid = false;
    bool has_uncached_descendants = true;

    /// Skipping is safe only when the artifact exists, its inputs are unchanged and every descendant is cached.
    bool can_skip() const {
        return self_cached && inputs_valid && !has_uncached_descendants;
    }
};

CacheVerdict check_cache_validity(CacheStatus &status, const BuildRule &rule);

/**
 * @brief CacheStatus backed by an artifact cache and the filesystem.
 *
 * One instance serves one build invocation: descendant results are memoized per rule and must
 * not outlive the invocation, since the cache and the files may change between builds.
 * Safe to query concurrently for different rules.
 */
class CacheValidityOracle : public CacheStatus {
public:
    CacheValidityOracle(const ArtifactCache &cache, const FileSystem &fs, Log &log)
        : cache_(cache), fs_(fs), log_(log) {
    }

    bool is_cached(const BuildRule &rule) override;
    bool inputs_still_valid(const BuildRule &rule) override;
    bool has_uncached_descendants(const BuildRule &rule) override;

private:
    bool valid_in_itself(const BuildRule &rule);

    const ArtifactCache &cache_;
    const FileSystem &fs_;
    Log &log_;

    std::mutex memo_mtx_;
    std::unordered_map<const BuildRule *, bool> uncached_descendants_;
};

} // namespace stamp
