#pragma once

/** \file index_builder.hpp
 *  \brief One-shot construction of a built HNSW index from a vector corpus.
 *
 * Validates the corpus, fits the scalar quantizer when requested, bulk-inserts in input order
 * over a bounded worker pool and freezes. build_and_save persists the result atomically.
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <span>

#include "semsearch/error.hpp"
#include "semsearch/index/hnsw.hpp"
#include "semsearch/index/scalar_quantizer.hpp"

namespace semsearch::index {

/** \brief Builder configuration. */
struct IndexBuildConfig {
    HnswBuildParams hnsw;                   /**< Graph parameters and worker count */
    bool quantize{false};                   /**< Store vectors as int8 codes */
    QuantizerParams quantizer;              /**< Fitting parameters when quantize is set */
    bool verbose{false};                    /**< Log phases to stderr */
};

/** \brief Build a frozen index over n = vectors.size() / dim row-major vectors.
 *
 * Node ids equal row positions.
 * Errors: invalid_argument (empty corpus, size not a multiple of dim, non-finite values),
 * config_invalid (bad graph parameters), anything add_batch reports.
 */
auto build_index(std::span<const float> vectors, std::size_t dim, const IndexBuildConfig& config)
    -> std::expected<HnswIndex, core::error>;

/** \brief build_index followed by save_index. Nothing is left at path on failure. */
auto build_and_save(std::span<const float> vectors, std::size_t dim, const IndexBuildConfig& config,
                    const std::filesystem::path& path)
    -> std::expected<HnswIndex, core::error>;

} // namespace semsearch::index
