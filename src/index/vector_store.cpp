#include "semsearch/index/vector_store.hpp"

namespace semsearch::index {

auto VectorStore::owned(std::size_t dim, ElementType type, std::size_t capacity) -> VectorStore {
    VectorStore s;
    s.dim_ = dim;
    s.type_ = type;
    s.row_bytes_ = dim * element_size(type);
    s.rows_ = capacity;
    s.arena_ = std::make_unique<std::byte[]>(s.row_bytes_ * capacity);
    s.base_ = s.arena_.get();
    return s;
}

auto VectorStore::borrowed(std::shared_ptr<const io::ByteSource> source,
                           std::vector<std::size_t> offsets,
                           std::size_t dim, ElementType type) -> VectorStore {
    VectorStore s;
    s.dim_ = dim;
    s.type_ = type;
    s.row_bytes_ = dim * element_size(type);
    s.rows_ = offsets.size();
    s.base_ = source->data();
    s.source_ = std::move(source);
    s.offsets_ = std::move(offsets);
    return s;
}

auto VectorStore::contiguous_f32() const noexcept -> const float* {
    if (type_ != ElementType::f32 || !offsets_.empty() || arena_ == nullptr) {
        return nullptr;
    }
    return reinterpret_cast<const float*>(arena_.get());
}

auto VectorStore::heap_bytes() const noexcept -> std::size_t {
    return (arena_ ? row_bytes_ * rows_ : 0) + offsets_.capacity() * sizeof(std::size_t);
}

} // namespace semsearch::index
