#pragma once

/** \file filesystem.hpp
 *  \brief POSIX file primitives used by index persistence.
 *
 * - RAII file descriptors
 * - Full-length read/write loops that retry on EINTR and short transfers
 * - fsync of files and directories
 * - Read-only private memory mappings
 */

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace semsearch::platform {

/** \brief File descriptor wrapper; closes on destruction. */
class FileHandle {
public:
    using native_handle_type = int;

    FileHandle() noexcept = default;

    explicit FileHandle(native_handle_type handle) noexcept
        : handle_(handle) {}

    ~FileHandle() {
        close();
    }

    FileHandle(FileHandle&& other) noexcept
        : handle_(other.handle_) {
        other.handle_ = invalid_handle();
    }

    auto operator=(FileHandle&& other) noexcept -> FileHandle& {
        if (this != &other) {
            close();
            handle_ = other.handle_;
            other.handle_ = invalid_handle();
        }
        return *this;
    }

    FileHandle(const FileHandle&) = delete;
    auto operator=(const FileHandle&) -> FileHandle& = delete;

    [[nodiscard]] auto get() const noexcept -> native_handle_type {
        return handle_;
    }

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return handle_ != invalid_handle();
    }

    auto close() noexcept -> void {
        if (is_valid()) {
            ::close(handle_);
            handle_ = invalid_handle();
        }
    }

private:
    [[nodiscard]] static constexpr auto invalid_handle() noexcept -> native_handle_type {
        return -1;
    }

    native_handle_type handle_ = invalid_handle();
};

/** \brief Open a file.
 *
 * \param write_mode true for write-only access, false for read-only
 * \param create true to create (and truncate) the file
 */
[[nodiscard]] inline auto open_file(const std::filesystem::path& path,
                                    bool write_mode = false,
                                    bool create = false)
    -> std::optional<FileHandle> {
    int flags = (write_mode ? O_WRONLY : O_RDONLY) | O_CLOEXEC;
    if (create) {
        flags |= O_CREAT | O_TRUNC;
    }
    const int fd = ::open(path.c_str(), flags, 0644);
    if (fd == -1) {
        return std::nullopt;
    }
    return FileHandle(fd);
}

/** \brief fsync; true on success. */
inline auto sync_file(const FileHandle& handle) noexcept -> bool {
    return handle.is_valid() && ::fsync(handle.get()) == 0;
}

/** \brief fsync the directory so a completed rename survives a crash. */
inline auto sync_directory(const std::filesystem::path& dir) noexcept -> bool {
    const auto& d = dir.empty() ? std::filesystem::path(".") : dir;
    const int fd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd == -1) {
        return false;
    }
    const bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

/** \brief File size, or nullopt if fstat fails. */
[[nodiscard]] inline auto get_file_size(const FileHandle& handle) noexcept
    -> std::optional<std::uint64_t> {
    struct stat st {};
    if (!handle.is_valid() || ::fstat(handle.get(), &st) != 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(st.st_size);
}

/** \brief Read exactly size bytes from the current position; false on error or EOF. */
inline auto read_exact(const FileHandle& handle, void* buffer, std::size_t size) noexcept -> bool {
    auto* out = static_cast<unsigned char*>(buffer);
    while (size > 0) {
        const ssize_t n = ::read(handle.get(), out, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        out += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

/** \brief Write all of buffer at the current position; false on error. */
inline auto write_all(const FileHandle& handle, const void* buffer, std::size_t size) noexcept -> bool {
    const auto* in = static_cast<const unsigned char*>(buffer);
    while (size > 0) {
        const ssize_t n = ::write(handle.get(), in, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        in += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

/** \brief Last errno rendered for error messages. */
inline auto last_error_message() -> std::string {
    return std::strerror(errno);
}

/** \brief Read-only private mapping of a whole file. */
class MappedFile {
public:
    MappedFile() noexcept = default;

    MappedFile(FileHandle&& file, std::size_t size)
        : file_(std::move(file))
        , size_(size) {
        if (!file_.is_valid() || size == 0) {
            return;
        }
        data_ = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, file_.get(), 0);
        if (data_ == MAP_FAILED) {
            data_ = nullptr;
        }
    }

    ~MappedFile() {
        unmap();
    }

    MappedFile(MappedFile&& other) noexcept
        : file_(std::move(other.file_))
        , data_(other.data_)
        , size_(other.size_) {
        other.data_ = nullptr;
        other.size_ = 0;
    }

    auto operator=(MappedFile&& other) noexcept -> MappedFile& {
        if (this != &other) {
            unmap();
            file_ = std::move(other.file_);
            data_ = other.data_;
            size_ = other.size_;
            other.data_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    MappedFile(const MappedFile&) = delete;
    auto operator=(const MappedFile&) -> MappedFile& = delete;

    [[nodiscard]] auto data() const noexcept -> const void* { return data_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }
    [[nodiscard]] auto is_valid() const noexcept -> bool { return data_ != nullptr; }

    /** \brief Hint sequential or random access; best effort. */
    auto advise_random() const noexcept -> void {
        if (data_) {
            (void)::madvise(data_, size_, MADV_RANDOM);
        }
    }

private:
    auto unmap() noexcept -> void {
        if (data_) {
            ::munmap(data_, size_);
            data_ = nullptr;
        }
    }

    FileHandle file_;
    void* data_ = nullptr;
    std::size_t size_ = 0;
};

} // namespace semsearch::platform
