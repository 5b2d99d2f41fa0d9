#include "stamp/artifact_cache.hpp"

#include "stamp/mmap.hpp"
#include "stamp/rule.hpp"
#include "stamp/sha1.hpp"

#include <atomic>
#include <cstdint>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <random>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace stamp {

namespace {

Result<void> write_file(const fs::path &path, std::string_view bytes) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create {}: {}", path.parent_path().string(), ec.message()));
    }

    // Readers must never observe a partially written entry, and concurrent writers of the
    // same entry each get their own temporary file.
    static std::atomic<uint64_t> tmp_counter{0};
    fs::path tmp = path;
    tmp += std::format(".{:x}-{}.tmp", std::random_device{}(), tmp_counter.fetch_add(1));

    bool written = false;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected(std::format("Failed to open {} for writing", tmp.string()));
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        written = static_cast<bool>(out);
    }
    if (written) {
        fs::rename(tmp, path, ec);
    }
    if (!written || ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        if (!written) {
            return std::unexpected(std::format("Failed to write {}", tmp.string()));
        }
        return std::unexpected(std::format("Failed to move {} into place: {}", path.string(), ec.message()));
    }
    return {};
}

Result<std::optional<std::string>> read_if_present(const fs::path &path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return std::unexpected(std::format("Failed to probe {}: {}", path.string(), ec.message()));
        }
        return std::nullopt;
    }
    auto file = MappedFile::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    return std::string(file->content());
}

} // namespace

Result<ArtifactMetadata> capture_metadata(const BuildRule &rule, const FileSystem &fs) {
    ArtifactMetadata metadata;
    metadata.rule_name = rule.name();
    for (const auto &input : rule.input_files()) {
        auto digest = fs.content_digest(input);
        if (!digest) {
            return std::unexpected(std::format("Cannot record input {} of {}: {}", input.string(), rule.name(), digest.error()));
        }
        metadata.inputs.insert_or_assign(input.generic_string(), to_hex(*digest));
    }
    return metadata;
}

fs::path DirectoryArtifactCache::artifact_path(const RuleKey &key) const {
    std::string hex = key.to_string();
    return root_ / hex.substr(0, 2) / hex;
}

fs::path DirectoryArtifactCache::metadata_path(const RuleKey &key) const {
    fs::path path = artifact_path(key);
    path += ".json";
    return path;
}

Result<bool> DirectoryArtifactCache::has_artifact(const RuleKey &key) const {
    if (!key.is_idempotent()) {
        return false;
    }
    std::error_code ec;
    bool present = fs::is_regular_file(artifact_path(key), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(std::format("Failed to probe cache entry {}: {}", key.to_string(), ec.message()));
    }
    return present;
}

Result<std::optional<std::string>> DirectoryArtifactCache::fetch_artifact(const RuleKey &key) const {
    if (!key.is_idempotent()) {
        return std::nullopt;
    }
    return read_if_present(artifact_path(key));
}

Result<std::optional<ArtifactMetadata>> DirectoryArtifactCache::fetch_metadata(const RuleKey &key) const {
    if (!key.is_idempotent()) {
        return std::nullopt;
    }
    auto text = read_if_present(metadata_path(key));
    if (!text) {
        return std::unexpected(text.error());
    }
    if (!*text) {
        return std::nullopt;
    }

    try {
        json j = json::parse(**text);
        ArtifactMetadata metadata;
        metadata.rule_name = j.at("rule").get<std::string>();
        for (const auto &[path, sha1] : j.at("inputs").items()) {
            metadata.inputs.emplace(path, sha1.get<std::string>());
        }
        return metadata;
    } catch (const json::exception &err) {
        return std::unexpected(std::format("Malformed cache metadata for {}: {}", key.to_string(), err.what()));
    }
}

Result<void> DirectoryArtifactCache::store(const RuleKey &key, std::string_view bytes, const ArtifactMetadata &metadata) {
    if (!key.is_idempotent()) {
        return std::unexpected(std::format("Refusing to cache {} under a non-idempotent key", metadata.rule_name));
    }

    json j;
    j["rule"] = metadata.rule_name;
    j["key"] = key.to_string();
    j["inputs"] = json::object();
    for (const auto &[path, sha1] : metadata.inputs) {
        j["inputs"][path] = sha1;
    }

    if (auto res = write_file(artifact_path(key), bytes); !res) {
        return res;
    }
    return write_file(metadata_path(key), j.dump(4));
}

} // namespace stamp
