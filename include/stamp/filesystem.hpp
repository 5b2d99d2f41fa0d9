#pragma once

#include "stamp/sha1.hpp"
#include "stamp/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace stamp {

/**
 * @brief Filesystem collaborator used for file-content digesting.
 *
 * Implementations must be safe to call concurrently from independent rules.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual Result<std::string> read_bytes(const std::filesystem::path &path) const = 0;

    /// SHA-1 of the file's current contents. The default digests read_bytes().
    virtual Result<Sha1Digest> content_digest(const std::filesystem::path &path) const;
};

/**
 * @brief Memo of file digests, validated against each file's modification time and size.
 */
class DigestCache {
public:
    struct Stamp {
        std::filesystem::file_time_type mtime;
        uintmax_t size = 0;

        bool operator==(const Stamp &) const = default;
    };

    std::optional<Sha1Digest> lookup(const std::filesystem::path &path, const Stamp &stamp) const;
    void update(const std::filesystem::path &path, const Stamp &stamp, const Sha1Digest &digest);
    void clear();

private:
    struct Entry {
        std::filesystem::path path;
        Stamp stamp;
        Sha1Digest digest;

        bool operator<(const std::filesystem::path &other_path) const {
            return path < other_path;
        }
    };

    std::vector<Entry> cache_;
    mutable std::shared_mutex cache_mtx_;
};

class RealFileSystem : public FileSystem {
public:
    Result<std::string> read_bytes(const std::filesystem::path &path) const override;
    Result<Sha1Digest> content_digest(const std::filesystem::path &path) const override;

private:
    mutable DigestCache digests_;
};

} // namespace stamp
