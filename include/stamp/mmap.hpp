#pragma once

#include "stamp/utility.hpp"

#include <cstddef>
#include <filesystem>
#include <format>
#include <string_view>
#include <utility>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace stamp {

/**
 * @brief Read-only memory mapping of a whole file.
 *
 * Used to digest file contents without copying them. Open failures are reported through
 * Result rather than thrown, since an unreadable input is an ordinary condition for the
 * fingerprinting code. Empty files map to an empty view.
 */
class MappedFile {
public:
    static Result<MappedFile> open(const std::filesystem::path &path) {
        MappedFile file;
#ifdef _WIN32
        file.file_handle_ = CreateFileW(
            path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (file.file_handle_ == INVALID_HANDLE_VALUE) {
            return std::unexpected(std::format("Failed to open file: {}", path.string()));
        }

        LARGE_INTEGER file_size;
        if (!GetFileSizeEx(file.file_handle_, &file_size)) {
            return std::unexpected(std::format("Failed to stat file: {}", path.string()));
        }
        file.size_ = static_cast<size_t>(file_size.QuadPart);
        if (file.size_ == 0) {
            return file;
        }

        file.mapping_handle_ = CreateFileMappingW(file.file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
        if (!file.mapping_handle_) {
            return std::unexpected(std::format("Failed to create file mapping: {}", path.string()));
        }
        void *addr = MapViewOfFile(file.mapping_handle_, FILE_MAP_READ, 0, 0, 0);
        if (!addr) {
            return std::unexpected(std::format("Failed to map view of file: {}", path.string()));
        }
        file.data_ = static_cast<char *>(addr);
#else
        file.fd_ = ::open(path.c_str(), O_RDONLY);
        if (file.fd_ == -1) {
            return std::unexpected(std::format("Failed to open file: {}", path.string()));
        }

        struct stat sb;
        if (fstat(file.fd_, &sb) == -1) {
            return std::unexpected(std::format("Failed to stat file: {}", path.string()));
        }
        if (!S_ISREG(sb.st_mode)) {
            return std::unexpected(std::format("Not a regular file: {}", path.string()));
        }
        file.size_ = static_cast<size_t>(sb.st_size);
        if (file.size_ == 0) {
            return file;
        }

        posix_fadvise(file.fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
        void *addr = mmap(nullptr, file.size_, PROT_READ, MAP_PRIVATE, file.fd_, 0);
        if (addr == MAP_FAILED) {
            return std::unexpected(std::format("Failed to mmap file: {}", path.string()));
        }
        file.data_ = static_cast<char *>(addr);
#endif
        return file;
    }

    MappedFile(MappedFile &&other) noexcept {
        swap(other);
    }
    MappedFile &operator=(MappedFile &&other) noexcept {
        if (this != &other) {
            MappedFile tmp(std::move(other));
            swap(tmp);
        }
        return *this;
    }
    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

    ~MappedFile() {
#ifdef _WIN32
        if (data_)
            UnmapViewOfFile(data_);
        if (mapping_handle_)
            CloseHandle(mapping_handle_);
        if (file_handle_ != INVALID_HANDLE_VALUE)
            CloseHandle(file_handle_);
#else
        if (data_)
            munmap(data_, size_);
        if (fd_ != -1)
            close(fd_);
#endif
    }

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    size_t size() const {
        return size_;
    }

private:
    MappedFile() = default;

    void swap(MappedFile &other) noexcept {
#ifdef _WIN32
        std::swap(file_handle_, other.file_handle_);
        std::swap(mapping_handle_, other.mapping_handle_);
#else
        std::swap(fd_, other.fd_);
#endif
        std::swap(data_, other.data_);
        std::swap(size_, other.size_);
    }

#ifdef _WIN32
    HANDLE file_handle_ = INVALID_HANDLE_VALUE;
    HANDLE mapping_handle_ = nullptr;
#else
    int fd_ = -1;
#endif
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace stamp
