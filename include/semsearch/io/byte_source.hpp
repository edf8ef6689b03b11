#pragma once

/** \file byte_source.hpp
 *  \brief Read-only byte-addressable storage behind the index loader.
 *
 * Two implementations:
 * - MemoryByteSource: owns its bytes (tests, small indexes, platforms without mmap)
 * - MappedByteSource: private read-only mapping of a file; pages are shared with the page cache
 *
 * Loaded indexes keep a shared_ptr to their source, so the bytes outlive every view into them.
 * Thread-safety: immutable after construction; safe for concurrent reads.
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include "semsearch/error.hpp"
#include "semsearch/platform/filesystem.hpp"

namespace semsearch::io {

class ByteSource {
public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual auto data() const noexcept -> const std::byte* = 0;
    [[nodiscard]] virtual auto size() const noexcept -> std::size_t = 0;
    [[nodiscard]] virtual auto is_mapped() const noexcept -> bool = 0;

    [[nodiscard]] auto bytes() const noexcept -> std::span<const std::byte> {
        return {data(), size()};
    }
};

class MemoryByteSource final : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<std::byte> bytes) noexcept
        : bytes_(std::move(bytes)) {}

    /** \brief Read a whole file into memory. Errors: io_failed. */
    static auto read_file(const std::filesystem::path& path)
        -> std::expected<std::shared_ptr<MemoryByteSource>, core::error>;

    [[nodiscard]] auto data() const noexcept -> const std::byte* override { return bytes_.data(); }
    [[nodiscard]] auto size() const noexcept -> std::size_t override { return bytes_.size(); }
    [[nodiscard]] auto is_mapped() const noexcept -> bool override { return false; }

private:
    std::vector<std::byte> bytes_;
};

class MappedByteSource final : public ByteSource {
public:
    /** \brief Map a whole file read-only. An empty file yields an empty source.
     *
     * Errors: io_failed when the file cannot be opened, sized or mapped.
     */
    static auto open(const std::filesystem::path& path)
        -> std::expected<std::shared_ptr<MappedByteSource>, core::error>;

    [[nodiscard]] auto data() const noexcept -> const std::byte* override {
        return static_cast<const std::byte*>(map_.data());
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t override { return map_.size(); }
    [[nodiscard]] auto is_mapped() const noexcept -> bool override { return true; }

private:
    explicit MappedByteSource(platform::MappedFile map) noexcept : map_(std::move(map)) {}

    platform::MappedFile map_;
};

} // namespace semsearch::io
