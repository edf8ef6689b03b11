#pragma once

/** \file embedding_backend.hpp
 *  \brief Text-to-vector embedding interface and the built-in hashing embedder.
 *
 * The serving and build paths treat the embedding model as an opaque batched function:
 * texts in, one fixed-length vector per text out, in input order.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "semsearch/error.hpp"

namespace semsearch::embed {

/** \brief Batched embedding model. */
class EmbeddingBackend {
public:
    virtual ~EmbeddingBackend() = default;

    /** \brief Output vector length. */
    [[nodiscard]] virtual auto dimension() const noexcept -> std::size_t = 0;

    /** \brief Embed texts into a row-major [texts.size() x dimension()] block.
     *
     * Errors: embedding_failed (whole batch).
     */
    virtual auto embed(std::span<const std::string> texts)
        -> std::expected<std::vector<float>, core::error> = 0;

    /** \brief Maximum concurrent embed() calls the backend tolerates (0 = unbounded). */
    [[nodiscard]] virtual auto max_concurrency() const noexcept -> std::size_t { return 0; }
};

/** \brief Deterministic feature-hashing embedder.
 *
 * Lowercased alphanumeric tokens and adjacent-token bigrams are hashed (FNV-1a) into
 * dimension() buckets with a hash-derived sign, then the vector is L2-normalized. Texts without
 * tokens embed to the zero vector. Thread-safe; no state beyond the dimension.
 */
class HashingEmbedder final : public EmbeddingBackend {
public:
    explicit HashingEmbedder(std::size_t dim = 384) noexcept : dim_(dim) {}

    [[nodiscard]] auto dimension() const noexcept -> std::size_t override { return dim_; }

    auto embed(std::span<const std::string> texts)
        -> std::expected<std::vector<float>, core::error> override;

    /** \brief Embed one text into out (out.size() == dimension()). */
    auto embed_one(std::string_view text, std::span<float> out) const -> void;

private:
    std::size_t dim_;
};

/** \brief Embed a corpus in chunks of batch_size texts. */
auto embed_corpus(EmbeddingBackend& backend, std::span<const std::string> texts,
                  std::size_t batch_size = 256)
    -> std::expected<std::vector<float>, core::error>;

} // namespace semsearch::embed
