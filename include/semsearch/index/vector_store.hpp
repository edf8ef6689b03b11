#pragma once

/** \file vector_store.hpp
 *  \brief Fixed-dimension row storage for index vectors (f32 or int8 codes).
 *
 * Two backings:
 * - owned: one contiguous arena sized at construction; rows never move, so concurrent
 *   inserters may write distinct rows while readers use finished ones
 * - borrowed: rows are views into an io::ByteSource (e.g. an mmapped index file) located by
 *   per-row byte offsets; the store keeps the source alive
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "semsearch/io/byte_source.hpp"

namespace semsearch::index {

/** \brief Element representation. Values are persisted in index headers. */
enum class ElementType : std::uint8_t {
    f32 = 0,
    i8 = 1,
};

constexpr std::size_t element_size(ElementType t) noexcept {
    return t == ElementType::f32 ? sizeof(float) : sizeof(std::int8_t);
}

class VectorStore {
public:
    VectorStore() = default;
    VectorStore(VectorStore&&) noexcept = default;
    VectorStore& operator=(VectorStore&&) noexcept = default;
    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    /** \brief Zero-initialised arena of capacity rows. */
    static auto owned(std::size_t dim, ElementType type, std::size_t capacity) -> VectorStore;

    /** \brief Rows borrowed from source at the given byte offsets.
     *
     * Preconditions: every offset + row_bytes lies within source; f32 rows are 4-byte aligned.
     */
    static auto borrowed(std::shared_ptr<const io::ByteSource> source,
                         std::vector<std::size_t> offsets,
                         std::size_t dim, ElementType type) -> VectorStore;

    [[nodiscard]] auto dim() const noexcept -> std::size_t { return dim_; }
    [[nodiscard]] auto type() const noexcept -> ElementType { return type_; }
    [[nodiscard]] auto row_bytes() const noexcept -> std::size_t { return row_bytes_; }
    [[nodiscard]] auto rows() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto is_borrowed() const noexcept -> bool { return source_ != nullptr; }

    /** \brief Contiguous f32 rows [rows x dim] for owned f32 stores, nullptr otherwise. */
    [[nodiscard]] auto contiguous_f32() const noexcept -> const float*;

    [[nodiscard]] auto row(std::uint32_t id) const noexcept -> const std::byte* {
        return offsets_.empty() ? base_ + static_cast<std::size_t>(id) * row_bytes_
                                : base_ + offsets_[id];
    }

    [[nodiscard]] auto f32_row(std::uint32_t id) const noexcept -> std::span<const float> {
        return {reinterpret_cast<const float*>(row(id)), dim_};
    }

    [[nodiscard]] auto i8_row(std::uint32_t id) const noexcept -> std::span<const std::int8_t> {
        return {reinterpret_cast<const std::int8_t*>(row(id)), dim_};
    }

    /** \brief Writable row; owned stores only. */
    [[nodiscard]] auto mutable_row(std::uint32_t id) noexcept -> std::byte* {
        return arena_.get() + static_cast<std::size_t>(id) * row_bytes_;
    }

    /** \brief Heap bytes held by this store (borrowed rows are not counted). */
    [[nodiscard]] auto heap_bytes() const noexcept -> std::size_t;

private:
    std::size_t dim_{0};
    ElementType type_{ElementType::f32};
    std::size_t row_bytes_{0};
    std::size_t rows_{0};
    const std::byte* base_{nullptr};
    std::unique_ptr<std::byte[]> arena_;
    std::shared_ptr<const io::ByteSource> source_;
    std::vector<std::size_t> offsets_;
};

} // namespace semsearch::index
