#pragma once

#include "stamp/filesystem.hpp"
#include "stamp/rule_key.hpp"
#include "stamp/utility.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace stamp {

class BuildRule;

/**
 * @brief What a cached artifact was built from.
 *
 * `inputs` maps every declared input file of the rule to the lower-case hex SHA-1 its contents
 * had when the artifact was stored.
 */
struct ArtifactMetadata {
    std::string rule_name;
    std::map<std::string, std::string> inputs;

    bool operator==(const ArtifactMetadata &) const = default;
};

/// Digests the rule's declared input files as they are now.
Result<ArtifactMetadata> capture_metadata(const BuildRule &rule, const FileSystem &fs);

/**
 * @brief Artifact-cache collaborator, keyed by rule key.
 *
 * Non-idempotent keys are never stored and never found. Errors are I/O failures; a miss is not
 * an error.
 */
class ArtifactCache {
public:
    virtual ~ArtifactCache() = default;

    virtual Result<bool> has_artifact(const RuleKey &key) const = 0;
    virtual Result<std::optional<std::string>> fetch_artifact(const RuleKey &key) const = 0;
    virtual Result<std::optional<ArtifactMetadata>> fetch_metadata(const RuleKey &key) const = 0;
    virtual Result<void> store(const RuleKey &key, std::string_view bytes, const ArtifactMetadata &metadata) = 0;
};

/**
 * @brief Artifact cache in a local directory.
 *
 * Layout: `<root>/<first two hex digits>/<hex>` holds the artifact and `<hex>.json` next to it
 * holds the metadata.
 */
class DirectoryArtifactCache : public ArtifactCache {
public:
    explicit DirectoryArtifactCache(std::filesystem::path root) : root_(std::move(root)) {
    }

    const std::filesystem::path &root() const {
        return root_;
    }

    Result<bool> has_artifact(const RuleKey &key) const override;
    Result<std::optional<std::string>> fetch_artifact(const RuleKey &key) const override;
    Result<std::optional<ArtifactMetadata>> fetch_metadata(const RuleKey &key) const override;
    Result<void> store(const RuleKey &key, std::string_view bytes, const ArtifactMetadata &metadata) override;

private:
    std::filesystem::path artifact_path(const RuleKey &key) const;
    std::filesystem::path metadata_path(const RuleKey &key) const;

    std::filesystem::path root_;
};

} // namespace stamp
