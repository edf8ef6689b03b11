#pragma once

/** \file hnsw.hpp
 *  \brief Hierarchical Navigable Small World (HNSW) index for high-recall ANN search.
 *
 * Features:
 * - Multi-layer proximity graph; layer 0 holds every node, upper layers a geometrically
 *   shrinking random subset
 * - Concurrent construction with per-node locks and a separate entry-point lock
 * - Diversity-heuristic neighbor selection (not closest-M)
 * - f32 or int8 (scalar quantized) vector storage, L2 or cosine distance
 * - Optional Roaring bitmap filter on search results
 *
 * Lifecycle: empty -> building (init) -> built (freeze or load). A built index is immutable and
 * safe for concurrent search without locking. There is no path back to building.
 * Memory: O(N * (D + M0)) for vectors and base-layer edges.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "roaring.hh"

#include "semsearch/error.hpp"
#include "semsearch/index/scalar_quantizer.hpp"
#include "semsearch/index/vector_store.hpp"
#include "semsearch/kernels/metric.hpp"

namespace semsearch::index {

/** \brief Sentinel for "no node". */
inline constexpr std::uint32_t kNoNode = 0xFFFFFFFFu;

/** \brief Index lifecycle state. */
enum class IndexState : std::uint8_t {
    empty,
    building,
    built,
};

/** \brief HNSW build parameters. */
struct HnswBuildParams {
    std::uint32_t M{16};                    /**< Max connections per node on layers >= 1 */
    std::uint32_t M0{0};                    /**< Max connections on layer 0 (0 = 2 * M) */
    std::uint32_t ef_construction{200};     /**< Beam width during construction */
    std::uint32_t max_level{16};            /**< Hard cap on the number of layers */
    kernels::Metric metric{kernels::Metric::l2};
    std::uint64_t seed{42};                 /**< Seed for level assignment */
    bool extend_candidates{false};          /**< Add candidates' neighbors before selection */
    bool keep_pruned_connections{false};    /**< Back-fill pruned candidates up to M */
    std::uint32_t num_threads{0};           /**< Insert workers for add_batch (0 = hardware, 1 = deterministic) */
    bool verbose{false};                    /**< Log build progress to stderr */
};

/** \brief HNSW search parameters. */
struct HnswSearchParams {
    std::uint32_t ef_search{64};            /**< Beam width on layer 0 (raised to k if smaller) */
    std::uint32_t k{10};                    /**< Number of neighbors to return */
    const roaring::Roaring* filter{nullptr}; /**< Only ids in the bitmap are returned */
};

/** \brief HNSW index statistics. */
struct HnswStats {
    std::size_t n_nodes{0};                 /**< Total nodes in graph */
    std::size_t n_edges{0};                 /**< Directed layer-0 edges */
    std::size_t n_levels{0};                /**< Number of hierarchy levels */
    std::size_t memory_bytes{0};            /**< Heap bytes (mapped vectors excluded) */
    float avg_degree{0.0f};                 /**< Mean layer-0 out-degree */
    std::size_t max_degree{0};              /**< Largest layer-0 out-degree */
    std::vector<std::size_t> level_counts;  /**< Nodes whose top level is i */
};

/** \brief Every piece of a built graph, handed over by the loader. */
struct HnswGraphImage {
    std::size_t dim{0};
    HnswBuildParams params;
    std::optional<QuantizationScale> scale;
    std::uint32_t entry_point{kNoNode};
    std::uint32_t max_layer{0};
    std::vector<std::uint32_t> levels;                               /**< [n] top level per node */
    std::vector<std::vector<std::vector<std::uint32_t>>> neighbors;  /**< [n][level + 1][deg] */
    VectorStore vectors;
};

/** \brief Hierarchical Navigable Small World index.
 *
 * Node ids are dense, assigned in insertion order starting at 0.
 */
class HnswIndex {
public:
    using Result = std::vector<std::pair<std::uint32_t, float>>;

    HnswIndex();
    ~HnswIndex();
    HnswIndex(HnswIndex&&) noexcept;
    HnswIndex& operator=(HnswIndex&&) noexcept;
    HnswIndex(const HnswIndex&) = delete;
    HnswIndex& operator=(const HnswIndex&) = delete;

    /** \brief Initialize an empty index for building.
     *
     * \param dim Vector dimensionality
     * \param params Build parameters
     * \param capacity Maximum number of vectors (node arena is sized once)
     * \param scale When set, vectors are stored as int8 codes under this scale
     * \return Success or config_invalid / precondition_failed
     *
     * Preconditions: state() == empty; dim > 0; capacity > 0; M >= 2; ef_construction >= 1;
     * cosine quantization requires a symmetric scale.
     */
    auto init(std::size_t dim, const HnswBuildParams& params, std::size_t capacity,
              const std::optional<QuantizationScale>& scale = std::nullopt)
        -> std::expected<void, core::error>;

    /** \brief Insert one vector; returns its dense id.
     *
     * Thread-safety: safe to call concurrently while building.
     * Complexity: O(M * log(N) * ef_construction)
     */
    auto add(std::span<const float> vector)
        -> std::expected<std::uint32_t, core::error>;

    /** \brief Insert n row-major vectors in input order over a bounded worker pool.
     *
     * Levels are drawn sequentially before any insert runs, so the level assignment depends
     * only on the seed; with num_threads == 1 the whole topology is deterministic.
     */
    auto add_batch(const float* data, std::size_t n)
        -> std::expected<void, core::error>;

    /** \brief Transition building -> built. Callers must have joined every add(). */
    auto freeze() -> std::expected<void, core::error>;

    /** \brief k nearest neighbors as (id, distance), ascending, ties by ascending id.
     *
     * Returns min(k, eligible nodes) results; a short beam is topped up by an exact scan.
     * Errors: not_built, dimension_mismatch.
     * Thread-safety: Safe for concurrent calls
     */
    auto search(std::span<const float> query, const HnswSearchParams& params) const
        -> std::expected<Result, core::error>;

    /** \brief Search n_queries row-major queries in parallel (OpenMP). */
    auto search_batch(std::span<const float> queries, std::size_t n_queries,
                      const HnswSearchParams& params) const
        -> std::expected<std::vector<Result>, core::error>;

    /** \brief Exact k nearest neighbors by brute force (ground truth). */
    auto exact_search(std::span<const float> query, std::uint32_t k,
                      const roaring::Roaring* filter = nullptr) const
        -> std::expected<Result, core::error>;

    /** \brief Adopt a graph produced by the loader. Validates structure (data_integrity). */
    static auto from_image(HnswGraphImage&& image) -> std::expected<HnswIndex, core::error>;

    [[nodiscard]] auto state() const noexcept -> IndexState;
    [[nodiscard]] auto dimension() const noexcept -> std::size_t;
    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto metric() const noexcept -> kernels::Metric;
    [[nodiscard]] auto is_quantized() const noexcept -> bool;
    [[nodiscard]] auto quantization_scale() const noexcept -> std::optional<QuantizationScale>;
    [[nodiscard]] auto build_params() const noexcept -> const HnswBuildParams&;
    [[nodiscard]] auto entry_point() const noexcept -> std::uint32_t;
    [[nodiscard]] auto max_layer() const noexcept -> std::uint32_t;

    /** \brief Top level of a node. Errors: out_of_range. */
    auto level_of(std::uint32_t id) const -> std::expected<std::uint32_t, core::error>;

    /** \brief Adjacency of a node; the view stays valid for the index lifetime.
     *
     * Errors: not_built (lists may still change), out_of_range.
     */
    auto neighbors(std::uint32_t id, std::uint32_t layer) const
        -> std::expected<std::span<const std::uint32_t>, core::error>;

    /** \brief Stored representation of a node's vector (f32 or int8 codes). */
    auto raw_vector(std::uint32_t id) const
        -> std::expected<std::span<const std::byte>, core::error>;

    /** \brief Get index statistics. Not meaningful while inserts are running. */
    auto get_stats() const noexcept -> HnswStats;

    /** \brief Nodes reachable from the entry point on layer 0. */
    auto reachable_count_base_layer() const noexcept -> std::size_t;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief Recall@k of approximate search against ground-truth ids.
 *
 * \param ground_truth [n_queries x k] exact neighbor ids
 * \return Fraction of ground-truth ids found, invalid_argument for an empty query set or
 *         k == 0, or the search error (not_built, dimension_mismatch)
 */
auto compute_recall(const HnswIndex& index,
                    const float* queries, std::size_t n_queries,
                    const std::uint32_t* ground_truth, std::size_t k,
                    const HnswSearchParams& params) -> std::expected<float, core::error>;

} // namespace semsearch::index
