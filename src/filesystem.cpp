#include "stamp/filesystem.hpp"

#include "stamp/mmap.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace stamp {

Result<Sha1Digest> FileSystem::content_digest(const fs::path &path) const {
    auto bytes = read_bytes(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return sha1_of(*bytes);
}

std::optional<Sha1Digest> DigestCache::lookup(const fs::path &path, const Stamp &stamp) const {
    std::shared_lock lock(cache_mtx_);
    auto it = std::lower_bound(cache_.begin(), cache_.end(), path);
    if (it != cache_.end() && it->path == path && it->stamp == stamp) {
        return it->digest;
    }
    return std::nullopt;
}

void DigestCache::update(const fs::path &path, const Stamp &stamp, const Sha1Digest &digest) {
    std::unique_lock lock(cache_mtx_);
    auto it = std::lower_bound(cache_.begin(), cache_.end(), path);
    if (it != cache_.end() && it->path == path) {
        it->stamp = stamp;
        it->digest = digest;
        return;
    }
    cache_.insert(it, Entry{path, stamp, digest});
}

void DigestCache::clear() {
    std::unique_lock lock(cache_mtx_);
    cache_.clear();
}

Result<std::string> RealFileSystem::read_bytes(const fs::path &path) const {
    auto file = MappedFile::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    return std::string(file->content());
}

Result<Sha1Digest> RealFileSystem::content_digest(const fs::path &path) const {
    std::error_code ec;
    DigestCache::Stamp stamp;
    stamp.mtime = fs::last_write_time(path, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to stat {}: {}", path.string(), ec.message()));
    }
    stamp.size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to stat {}: {}", path.string(), ec.message()));
    }

    if (auto cached = digests_.lookup(path, stamp)) {
        return *cached;
    }

    auto file = MappedFile::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    Sha1Digest digest = sha1_of(file->content());
    // The file changed between the stat and the map; the stamp no longer describes these bytes.
    if (file->size() == stamp.size) {
        digests_.update(path, stamp, digest);
    }
    return digest;
}

} // namespace stamp
