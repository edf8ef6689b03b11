#include "semsearch/index/hnsw.hpp"
#include "semsearch/core/platform_utils.hpp"
#include "semsearch/core/thread_pool.hpp"
#include "semsearch/kernels/dispatch.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstring>
#include <functional>
#include <iostream>
#include <mutex>
#include <queue>
#include <random>
#include <shared_mutex>
#include <string>

namespace semsearch::index {

namespace {

// (distance, id): the natural pair ordering is distance first, then ascending id.
using Candidate = std::pair<float, std::uint32_t>;
using MinQueue = std::priority_queue<Candidate, std::vector<Candidate>, std::greater<>>;
using MaxQueue = std::priority_queue<Candidate>;

auto hnsw_error(core::error_code code, std::string message) -> core::error {
    return core::error{code, std::move(message), "index.hnsw"};
}

/** \brief Thread-local epoch-based visited marks (avoids hash set overhead). */
struct VisitedList {
    std::vector<std::uint32_t> seen;
    std::uint32_t epoch{0};

    auto reset(std::size_t n) -> void {
        if (seen.size() < n) seen.resize(n, 0);
        if (++epoch == 0) {
            std::fill(seen.begin(), seen.end(), 0u);
            epoch = 1;
        }
    }

    auto test_and_set(std::uint32_t id) noexcept -> bool {
        if (seen[id] == epoch) return true;
        seen[id] = epoch;
        return false;
    }
};

auto visited_scratch() -> VisitedList& {
    thread_local VisitedList tls;
    return tls;
}

inline auto passes(const roaring::Roaring* filter, std::uint32_t id) -> bool {
    return filter == nullptr || filter->contains(id);
}

auto to_result(const std::vector<Candidate>& found, std::size_t k) -> HnswIndex::Result {
    HnswIndex::Result out;
    out.reserve(std::min(k, found.size()));
    for (std::size_t i = 0; i < found.size() && i < k; ++i) {
        out.emplace_back(found[i].second, found[i].first);
    }
    return out;
}

} // namespace

/** \brief Node in HNSW graph. The vector lives in the index's VectorStore under the same id. */
struct HnswNode {
    std::uint32_t level{0};
    std::vector<std::vector<std::uint32_t>> neighbors;  // Per level
};

/** \brief Internal implementation of HNSW index. */
class HnswIndex::Impl {
public:
    struct State {
        std::atomic<IndexState> state{IndexState::empty};
        std::size_t dim{0};
        HnswBuildParams params;                 // M0 resolved at init
        std::size_t capacity{0};
        std::optional<QuantizationScale> scale;
        float l2_scale_sq{1.0f};                // scale^2 applied to integer L2
        double level_multiplier{1.0 / std::log(16.0)};
        bool verbose{false};
        const kernels::KernelOps* ops{nullptr}; // Selected once at init
    } state_;

    std::vector<HnswNode> nodes_;               // Arena sized to capacity; nodes never move
    std::unique_ptr<std::mutex[]> node_locks_;  // One per node; released at freeze
    VectorStore vectors_;
    std::atomic<std::size_t> count_{0};

    // Slot reservation and level draws, sequential in id order
    std::mutex level_mutex_;
    std::uint32_t drawn_max_level_{0};
    std::mt19937_64 rng_;

    // Entry point and top layer; every search reads them first
    mutable std::shared_mutex entry_mutex_;
    std::uint32_t entry_point_{kNoNode};
    std::uint32_t max_layer_{0};

    /** \brief Neighbor snapshot under the node lock; used while building. */
    struct LockedNeighbors {
        const Impl* self;
        auto operator()(std::uint32_t id, std::uint32_t layer) const -> std::vector<std::uint32_t> {
            std::lock_guard<std::mutex> g(self->node_locks_[id]);
            return self->nodes_[id].neighbors[layer];
        }
    };

    /** \brief Direct view; the graph no longer changes once built. */
    struct FrozenNeighbors {
        const Impl* self;
        auto operator()(std::uint32_t id, std::uint32_t layer) const -> std::span<const std::uint32_t> {
            return self->nodes_[id].neighbors[layer];
        }
    };

    auto init(std::size_t dim, const HnswBuildParams& params, std::size_t capacity,
              const std::optional<QuantizationScale>& scale)
        -> std::expected<void, core::error>;

    [[nodiscard]] auto max_degree(std::uint32_t layer) const noexcept -> std::uint32_t {
        return layer == 0 ? state_.params.M0 : state_.params.M;
    }

    [[nodiscard]] auto distance(const std::byte* a, const std::byte* b) const noexcept -> float {
        const std::size_t d = state_.dim;
        if (vectors_.type() == ElementType::f32) {
            const std::span<const float> fa(reinterpret_cast<const float*>(a), d);
            const std::span<const float> fb(reinterpret_cast<const float*>(b), d);
            return state_.params.metric == kernels::Metric::l2 ? state_.ops->l2_sq(fa, fb)
                                                               : state_.ops->cosine_distance(fa, fb);
        }
        const std::span<const std::int8_t> qa(reinterpret_cast<const std::int8_t*>(a), d);
        const std::span<const std::int8_t> qb(reinterpret_cast<const std::int8_t*>(b), d);
        if (state_.params.metric == kernels::Metric::l2) {
            return state_.l2_scale_sq * static_cast<float>(state_.ops->l2_sq_i8(qa, qb));
        }
        return state_.ops->cosine_distance_i8(qa, qb);
    }

    [[nodiscard]] auto node_distance(const std::byte* query, std::uint32_t id) const noexcept -> float {
        return distance(query, vectors_.row(id));
    }

    /** \brief Beam search on one layer with a capped result heap.
     *
     * Shared by insertion (LockedNeighbors, ef_construction) and query (FrozenNeighbors,
     * ef_search); breadth 1 gives the greedy descent step. Filtered-out nodes are still
     * traversed but never admitted to the result set.
     */
    template <typename NeighborSource>
    auto search_layer(const std::byte* query, std::span<const std::uint32_t> entry_points,
                      std::uint32_t ef, std::uint32_t layer, const NeighborSource& neighbors_of,
                      const roaring::Roaring* filter = nullptr) const -> std::vector<Candidate> {
        auto& visited = visited_scratch();
        visited.reset(nodes_.size());

        MinQueue candidates;
        MaxQueue nearest;
        for (const std::uint32_t ep : entry_points) {
            if (visited.test_and_set(ep)) continue;
            const Candidate c{node_distance(query, ep), ep};
            candidates.push(c);
            if (passes(filter, ep)) {
                nearest.push(c);
                if (nearest.size() > ef) nearest.pop();
            }
        }

        while (!candidates.empty()) {
            const Candidate current = candidates.top();
            if (nearest.size() >= ef && nearest.top() < current) {
                break;
            }
            candidates.pop();

            const auto neighbors = neighbors_of(current.second, layer);
            for (const std::uint32_t nb : neighbors) {
                if (visited.test_and_set(nb)) continue;
                const Candidate c{node_distance(query, nb), nb};
                if (nearest.size() < ef || c < nearest.top()) {
                    candidates.push(c);
                    if (passes(filter, nb)) {
                        nearest.push(c);
                        if (nearest.size() > ef) nearest.pop();
                    }
                }
            }
        }

        std::vector<Candidate> result(nearest.size());
        for (auto it = result.rbegin(); it != result.rend(); ++it) {
            *it = nearest.top();
            nearest.pop();
        }
        return result;
    }

    /** \brief Diversity heuristic: walk candidates closest first and keep one only if it is
     *  closer to the base than to every neighbor already kept.
     */
    auto select_neighbors(std::vector<Candidate> candidates, std::uint32_t M) const
        -> std::vector<Candidate> {
        std::sort(candidates.begin(), candidates.end());

        std::vector<Candidate> selected;
        std::vector<Candidate> pruned;
        selected.reserve(M);
        for (const auto& c : candidates) {
            if (selected.size() >= M) break;
            const std::byte* cv = vectors_.row(c.second);
            bool diverse = true;
            for (const auto& s : selected) {
                if (distance(cv, vectors_.row(s.second)) < c.first) {
                    diverse = false;
                    break;
                }
            }
            (diverse ? selected : pruned).push_back(c);
        }

        if (state_.params.keep_pruned_connections) {
            for (const auto& p : pruned) {
                if (selected.size() >= M) break;
                selected.push_back(p);
            }
            std::sort(selected.begin(), selected.end());
        }
        return selected;
    }

    /** \brief Add candidates' own neighbors to the candidate set (extend_candidates). */
    auto extend_candidates(const std::byte* query, std::uint32_t self, std::uint32_t layer,
                           std::vector<Candidate>& candidates) const -> void {
        const LockedNeighbors source{this};
        auto& visited = visited_scratch();
        visited.reset(nodes_.size());
        visited.test_and_set(self);
        for (const auto& c : candidates) visited.test_and_set(c.second);

        const std::size_t original = candidates.size();
        for (std::size_t i = 0; i < original; ++i) {
            for (const std::uint32_t nb : source(candidates[i].second, layer)) {
                if (!visited.test_and_set(nb)) {
                    candidates.emplace_back(node_distance(query, nb), nb);
                }
            }
        }
    }

    /** \brief Merge ids into node's adjacency on layer; prune back to the bound by the
     *  selection heuristic when it overflows. Holds only node's lock.
     */
    auto connect(std::uint32_t node, std::span<const std::uint32_t> additions, std::uint32_t layer) -> void {
        const std::uint32_t bound = max_degree(layer);
        std::lock_guard<std::mutex> g(node_locks_[node]);
        auto& list = nodes_[node].neighbors[layer];
        for (const std::uint32_t other : additions) {
            if (other == node || std::find(list.begin(), list.end(), other) != list.end()) continue;
            list.push_back(other);
        }
        if (list.size() <= bound) return;

        std::vector<Candidate> pool;
        pool.reserve(list.size());
        const std::byte* base = vectors_.row(node);
        for (const std::uint32_t other : list) {
            pool.emplace_back(distance(base, vectors_.row(other)), other);
        }
        const auto kept = select_neighbors(std::move(pool), bound);
        list.clear();
        for (const auto& c : kept) list.push_back(c.second);
    }

    /** \brief Link node id (vector and level already stored) into the graph. */
    auto insert(std::uint32_t id) -> void {
        const std::byte* q = vectors_.row(id);
        const std::uint32_t level = nodes_[id].level;

        std::uint32_t ep;
        std::uint32_t top;
        {
            std::shared_lock<std::shared_mutex> lock(entry_mutex_);
            ep = entry_point_;
            top = max_layer_;
        }
        if (ep == kNoNode) {
            std::unique_lock<std::shared_mutex> lock(entry_mutex_);
            if (entry_point_ == kNoNode) {
                entry_point_ = id;
                max_layer_ = level;
                return;
            }
            ep = entry_point_;
            top = max_layer_;
        }

        const LockedNeighbors source{this};
        std::vector<std::uint32_t> entry{ep};
        for (std::uint32_t lc = top; lc > level; --lc) {
            const auto nearest = search_layer(q, entry, 1, lc, source);
            entry.assign(1, nearest.front().second);
        }

        std::vector<std::uint32_t> chosen;
        for (std::int64_t lc = std::min(level, top); lc >= 0; --lc) {
            const auto layer = static_cast<std::uint32_t>(lc);
            auto candidates = search_layer(q, entry, state_.params.ef_construction, layer, source);
            // A concurrent inserter may already have linked us on this layer.
            std::erase_if(candidates, [id](const Candidate& c) { return c.second == id; });
            if (candidates.empty()) continue;

            entry.clear();
            for (const auto& c : candidates) entry.push_back(c.second);

            if (state_.params.extend_candidates) {
                extend_candidates(q, id, layer, candidates);
            }
            const auto selected = select_neighbors(std::move(candidates), max_degree(layer));

            chosen.clear();
            for (const auto& c : selected) chosen.push_back(c.second);
            connect(id, chosen, layer);
            for (const std::uint32_t nb : chosen) {
                connect(nb, std::span<const std::uint32_t>(&id, 1), layer);
            }
        }

        if (level > top) {
            std::unique_lock<std::shared_mutex> lock(entry_mutex_);
            if (level > max_layer_) {
                entry_point_ = id;
                max_layer_ = level;
            }
        }
    }

    /** \brief Level from an exponential draw, capped at (max level drawn so far) + 1.
     *  Caller holds level_mutex_.
     */
    auto draw_level() -> std::uint32_t {
        std::uniform_real_distribution<double> unif(0.0, 1.0);
        const double u = 1.0 - unif(rng_);  // (0, 1]
        const double raw = std::floor(-std::log(u) * state_.level_multiplier);
        const std::uint32_t cap = std::min(drawn_max_level_ + 1, state_.params.max_level - 1);
        const auto level = raw >= static_cast<double>(cap) ? cap : static_cast<std::uint32_t>(raw);
        drawn_max_level_ = std::max(drawn_max_level_, level);
        return level;
    }

    /** \brief Reserve n consecutive ids and assign their levels. */
    auto reserve(std::size_t n) -> std::expected<std::uint32_t, core::error> {
        std::lock_guard<std::mutex> g(level_mutex_);
        const std::size_t first = count_.load(std::memory_order_relaxed);
        if (n > state_.capacity - first) {
            return std::unexpected(hnsw_error(core::error_code::resource_exhausted,
                "index capacity " + std::to_string(state_.capacity) + " exceeded"));
        }
        for (std::size_t i = first; i < first + n; ++i) {
            auto& node = nodes_[i];
            node.level = draw_level();
            node.neighbors.resize(node.level + 1);
        }
        count_.store(first + n, std::memory_order_release);
        return static_cast<std::uint32_t>(first);
    }

    auto store_vector(std::uint32_t id, const float* data) -> void {
        std::byte* dst = vectors_.mutable_row(id);
        if (state_.scale) {
            quantize(std::span<const float>(data, state_.dim), *state_.scale,
                     std::span<std::int8_t>(reinterpret_cast<std::int8_t*>(dst), state_.dim));
        } else {
            std::memcpy(dst, data, state_.dim * sizeof(float));
        }
    }

    auto check_building() const -> std::expected<void, core::error> {
        if (state_.state.load(std::memory_order_acquire) != IndexState::building) {
            return std::unexpected(hnsw_error(core::error_code::precondition_failed,
                "index is not accepting inserts (init() not called or already frozen)"));
        }
        return {};
    }

    auto check_built() const -> std::expected<void, core::error> {
        if (state_.state.load(std::memory_order_acquire) != IndexState::built) {
            return std::unexpected(hnsw_error(core::error_code::not_built,
                "index is not built; call freeze() or load an index first"));
        }
        return {};
    }

    /** \brief Query bytes in the stored representation (quantized when needed). */
    auto prepare_query(std::span<const float> query) const -> const std::byte* {
        if (!state_.scale) {
            return reinterpret_cast<const std::byte*>(query.data());
        }
        thread_local std::vector<std::int8_t> codes;
        codes.resize(state_.dim);
        quantize(query, *state_.scale, codes);
        return reinterpret_cast<const std::byte*>(codes.data());
    }

    /** \brief Exact distances of every eligible node not already in found. */
    auto top_up(const std::byte* q, std::vector<Candidate>& found, std::size_t want,
                const roaring::Roaring* filter) const -> void {
        auto& visited = visited_scratch();
        visited.reset(nodes_.size());
        for (const auto& c : found) visited.test_and_set(c.second);
        const auto n = static_cast<std::uint32_t>(count_.load(std::memory_order_acquire));
        for (std::uint32_t id = 0; id < n; ++id) {
            if (!passes(filter, id) || visited.test_and_set(id)) continue;
            found.emplace_back(node_distance(q, id), id);
        }
        const auto keep = std::min(want, found.size());
        std::partial_sort(found.begin(), found.begin() + static_cast<std::ptrdiff_t>(keep), found.end());
        found.resize(keep);
    }

    auto search(std::span<const float> query, const HnswSearchParams& params) const
        -> std::expected<Result, core::error> {
        if (auto ok = check_built(); !ok) return std::unexpected(ok.error());
        if (query.size() != state_.dim) {
            return std::unexpected(hnsw_error(core::error_code::dimension_mismatch,
                "query has " + std::to_string(query.size()) + " components, index dimension is " +
                std::to_string(state_.dim)));
        }
        const std::size_t n = count_.load(std::memory_order_acquire);
        if (n == 0 || params.k == 0) {
            return Result{};
        }

        const std::byte* q = prepare_query(query);
        const FrozenNeighbors source{this};

        std::uint32_t cur = entry_point_;
        for (std::uint32_t lc = max_layer_; lc > 0; --lc) {
            const auto nearest = search_layer(q, std::span<const std::uint32_t>(&cur, 1), 1, lc, source);
            cur = nearest.front().second;
        }

        const std::uint32_t ef = std::max(params.ef_search, params.k);
        auto found = search_layer(q, std::span<const std::uint32_t>(&cur, 1), ef, 0, source, params.filter);

        std::size_t eligible = n;
        if (params.filter != nullptr) {
            eligible = static_cast<std::size_t>(params.filter->rank(static_cast<std::uint32_t>(n - 1)));
        }
        const std::size_t want = std::min<std::size_t>(params.k, eligible);
        if (found.size() < want) {
            top_up(q, found, want, params.filter);
        }
        return to_result(found, params.k);
    }

    auto exact_search(std::span<const float> query, std::uint32_t k,
                      const roaring::Roaring* filter) const -> std::expected<Result, core::error> {
        if (auto ok = check_built(); !ok) return std::unexpected(ok.error());
        if (query.size() != state_.dim) {
            return std::unexpected(hnsw_error(core::error_code::dimension_mismatch,
                "query has " + std::to_string(query.size()) + " components, index dimension is " +
                std::to_string(state_.dim)));
        }
        const auto n = static_cast<std::uint32_t>(count_.load(std::memory_order_acquire));
        std::vector<float> dists(n);
        const float* contiguous = vectors_.contiguous_f32();
        if (contiguous != nullptr && state_.params.metric == kernels::Metric::l2) {
            state_.ops->batch_l2_sq(query, contiguous, n, state_.dim, dists.data());
        } else {
            const std::byte* q = prepare_query(query);
            for (std::uint32_t id = 0; id < n; ++id) {
                dists[id] = node_distance(q, id);
            }
        }

        std::vector<Candidate> all;
        all.reserve(n);
        for (std::uint32_t id = 0; id < n; ++id) {
            if (passes(filter, id)) all.emplace_back(dists[id], id);
        }
        const auto keep = std::min<std::size_t>(k, all.size());
        std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(keep), all.end());
        all.resize(keep);
        return to_result(all, keep);
    }

    /** \brief Copy of an adjacency list; locks only while building. */
    auto copy_neighbors(std::uint32_t id, std::uint32_t layer) const -> std::vector<std::uint32_t> {
        if (node_locks_) {
            std::lock_guard<std::mutex> g(node_locks_[id]);
            return nodes_[id].neighbors[layer];
        }
        return nodes_[id].neighbors[layer];
    }

    auto degree(std::uint32_t id, std::uint32_t layer) const noexcept -> std::size_t {
        if (node_locks_) {
            std::lock_guard<std::mutex> g(node_locks_[id]);
            return nodes_[id].neighbors[layer].size();
        }
        return nodes_[id].neighbors[layer].size();
    }

    auto reachable_count_base_layer() const -> std::size_t;
};

auto HnswIndex::Impl::init(std::size_t dim, const HnswBuildParams& params, std::size_t capacity,
                           const std::optional<QuantizationScale>& scale)
    -> std::expected<void, core::error> {
    using core::error_code;

    if (state_.state.load() != IndexState::empty) {
        return std::unexpected(hnsw_error(error_code::precondition_failed, "index already initialized"));
    }
    if (dim == 0) {
        return std::unexpected(hnsw_error(error_code::config_invalid, "dimension must be > 0"));
    }
    if (capacity == 0 || capacity >= kNoNode) {
        return std::unexpected(hnsw_error(error_code::config_invalid,
            "capacity must be in [1, 2^32 - 1)"));
    }
    if (params.M < 2) {
        return std::unexpected(hnsw_error(error_code::config_invalid, "M must be >= 2"));
    }
    if (params.M0 != 0 && params.M0 < params.M) {
        return std::unexpected(hnsw_error(error_code::config_invalid, "M0 must be >= M"));
    }
    if (params.ef_construction == 0) {
        return std::unexpected(hnsw_error(error_code::config_invalid, "ef_construction must be > 0"));
    }
    if (params.max_level == 0) {
        return std::unexpected(hnsw_error(error_code::config_invalid, "max_level must be > 0"));
    }
    if (scale) {
        if (!(scale->scale > 0.0f) || !std::isfinite(scale->scale)) {
            return std::unexpected(hnsw_error(error_code::config_invalid, "quantization scale must be positive"));
        }
        if (params.metric == kernels::Metric::cosine && scale->has_zero_point) {
            return std::unexpected(hnsw_error(error_code::config_invalid,
                "cosine quantization requires a symmetric scale"));
        }
    }

    state_.dim = dim;
    state_.params = params;
    if (state_.params.M0 == 0) {
        state_.params.M0 = 2 * params.M;
    }
    state_.capacity = capacity;
    state_.scale = scale;
    state_.l2_scale_sq = scale ? scale->scale * scale->scale : 1.0f;
    state_.level_multiplier = 1.0 / std::log(static_cast<double>(params.M));
    state_.verbose = params.verbose || core::verbose_from_env();
    state_.ops = &kernels::select_backend_auto();
    rng_.seed(params.seed);

    nodes_.resize(capacity);
    node_locks_ = std::make_unique<std::mutex[]>(capacity);
    vectors_ = VectorStore::owned(dim, scale ? ElementType::i8 : ElementType::f32, capacity);

    if (state_.verbose) {
        std::cerr << "[hnsw][init] dim=" << dim << " capacity=" << capacity
                  << " M=" << state_.params.M << " M0=" << state_.params.M0
                  << " efC=" << params.ef_construction
                  << " metric=" << kernels::to_string(params.metric)
                  << " quantized=" << (scale ? "yes" : "no")
                  << " kernels=" << state_.ops->name << std::endl;
    }

    state_.state.store(IndexState::building, std::memory_order_release);
    return {};
}

auto HnswIndex::Impl::reachable_count_base_layer() const -> std::size_t {
    const auto n = count_.load(std::memory_order_acquire);
    std::uint32_t ep;
    {
        std::shared_lock<std::shared_mutex> lock(entry_mutex_);
        ep = entry_point_;
    }
    if (n == 0 || ep == kNoNode) return 0;

    std::vector<char> visited(n, 0);
    std::queue<std::uint32_t> q;
    visited[ep] = 1;
    q.push(ep);

    std::size_t count = 0;
    while (!q.empty()) {
        const auto current = q.front();
        q.pop();
        ++count;
        for (const std::uint32_t nb : copy_neighbors(current, 0)) {
            if (nb < n && !visited[nb]) {
                visited[nb] = 1;
                q.push(nb);
            }
        }
    }
    return count;
}

// HnswIndex public interface implementation

HnswIndex::HnswIndex() : impl_(std::make_unique<Impl>()) {}
HnswIndex::~HnswIndex() = default;
HnswIndex::HnswIndex(HnswIndex&&) noexcept = default;
HnswIndex& HnswIndex::operator=(HnswIndex&&) noexcept = default;

auto HnswIndex::init(std::size_t dim, const HnswBuildParams& params, std::size_t capacity,
                     const std::optional<QuantizationScale>& scale)
    -> std::expected<void, core::error> {
    return impl_->init(dim, params, capacity, scale);
}

auto HnswIndex::add(std::span<const float> vector) -> std::expected<std::uint32_t, core::error> {
    if (auto ok = impl_->check_building(); !ok) return std::unexpected(ok.error());
    if (vector.size() != impl_->state_.dim) {
        return std::unexpected(hnsw_error(core::error_code::dimension_mismatch,
            "vector has " + std::to_string(vector.size()) + " components, index dimension is " +
            std::to_string(impl_->state_.dim)));
    }
    auto id = impl_->reserve(1);
    if (!id) return std::unexpected(id.error());
    impl_->store_vector(*id, vector.data());
    try {
        impl_->insert(*id);
    } catch (const std::exception& e) {
        return std::unexpected(hnsw_error(core::error_code::internal,
            std::string("insert failed: ") + e.what()));
    }
    return *id;
}

auto HnswIndex::add_batch(const float* data, std::size_t n) -> std::expected<void, core::error> {
    if (auto ok = impl_->check_building(); !ok) return std::unexpected(ok.error());
    if (n == 0) return {};
    if (data == nullptr) {
        return std::unexpected(hnsw_error(core::error_code::invalid_argument, "null vector data"));
    }

    auto first = impl_->reserve(n);
    if (!first) return std::unexpected(first.error());
    const std::size_t dim = impl_->state_.dim;
    for (std::size_t i = 0; i < n; ++i) {
        impl_->store_vector(static_cast<std::uint32_t>(*first + i), data + i * dim);
    }

    const auto t0 = std::chrono::steady_clock::now();
    const std::uint32_t threads = impl_->state_.params.num_threads;
    std::size_t workers = 1;
    try {
        if (threads == 1 || n == 1) {
            for (std::size_t i = 0; i < n; ++i) {
                impl_->insert(static_cast<std::uint32_t>(*first + i));
            }
        } else {
            core::ThreadPool pool(threads, "semsearch-build");
            workers = pool.num_threads();
            Impl* impl = impl_.get();
            pool.parallel_for(*first, *first + n, [impl](std::size_t i) {
                impl->insert(static_cast<std::uint32_t>(i));
            });
        }
    } catch (const std::exception& e) {
        return std::unexpected(hnsw_error(core::error_code::internal,
            std::string("parallel insert failed: ") + e.what()));
    }

    if (impl_->state_.verbose) {
        const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        std::cerr << "[hnsw][build] inserted " << n << " vectors in " << secs << "s"
                  << " (workers=" << workers << ", entry=" << impl_->entry_point_
                  << ", max_layer=" << impl_->max_layer_ << ")" << std::endl;
    }
    return {};
}

auto HnswIndex::freeze() -> std::expected<void, core::error> {
    if (auto ok = impl_->check_building(); !ok) return std::unexpected(ok.error());
    impl_->nodes_.resize(impl_->count_.load(std::memory_order_acquire));
    impl_->node_locks_.reset();
    impl_->state_.state.store(IndexState::built, std::memory_order_release);
    return {};
}

auto HnswIndex::search(std::span<const float> query, const HnswSearchParams& params) const
    -> std::expected<Result, core::error> {
    return impl_->search(query, params);
}

auto HnswIndex::search_batch(std::span<const float> queries, std::size_t n_queries,
                             const HnswSearchParams& params) const
    -> std::expected<std::vector<Result>, core::error> {
    if (auto ok = impl_->check_built(); !ok) return std::unexpected(ok.error());
    const std::size_t dim = impl_->state_.dim;
    if (queries.size() != n_queries * dim) {
        return std::unexpected(hnsw_error(core::error_code::dimension_mismatch,
            "query block has " + std::to_string(queries.size()) + " values, expected " +
            std::to_string(n_queries) + " x " + std::to_string(dim)));
    }

    std::vector<Result> results(n_queries);
    std::atomic<bool> has_error{false};
    std::mutex err_mu;
    core::error first_error{core::error_code::ok, {}, {}};
    auto record = [&](core::error e) {
        has_error.store(true, std::memory_order_relaxed);
        std::lock_guard<std::mutex> g(err_mu);
        if (first_error.code == core::error_code::ok) first_error = std::move(e);
    };

    #pragma omp parallel for schedule(dynamic)
    for (std::int64_t i = 0; i < static_cast<std::int64_t>(n_queries); ++i) {
        if (has_error.load(std::memory_order_relaxed)) continue;  // fail-fast
        const auto row = static_cast<std::size_t>(i);
        try {
            auto r = impl_->search(queries.subspan(row * dim, dim), params);
            if (r) {
                results[row] = std::move(*r);
            } else {
                record(r.error());
            }
        } catch (const std::exception& e) {
            record(hnsw_error(core::error_code::internal,
                std::string("exception in search_batch: ") + e.what()));
        } catch (...) {
            // Exceptions must not cross the OpenMP region; surface as an error.
            record(hnsw_error(core::error_code::internal, "unknown exception in search_batch"));
        }
    }

    if (has_error.load(std::memory_order_relaxed)) {
        return std::unexpected(first_error);
    }
    return results;
}

auto HnswIndex::exact_search(std::span<const float> query, std::uint32_t k,
                             const roaring::Roaring* filter) const
    -> std::expected<Result, core::error> {
    return impl_->exact_search(query, k, filter);
}

auto HnswIndex::from_image(HnswGraphImage&& image) -> std::expected<HnswIndex, core::error> {
    using core::error_code;
    auto corrupt = [](std::string msg) {
        return std::unexpected(hnsw_error(error_code::data_integrity, std::move(msg)));
    };

    const std::size_t n = image.levels.size();
    const auto& p = image.params;
    if (image.dim == 0 || image.vectors.dim() != image.dim) return corrupt("vector dimension mismatch");
    if (image.vectors.rows() != n || image.neighbors.size() != n) return corrupt("node count mismatch");
    if (p.M < 2 || p.M0 < p.M) return corrupt("invalid degree bounds");
    if ((image.vectors.type() == ElementType::i8) != image.scale.has_value()) {
        return corrupt("quantization flag does not match vector payload");
    }
    if (n > 0 && (image.entry_point >= n || image.levels[image.entry_point] != image.max_layer)) {
        return corrupt("entry point does not sit on the top layer");
    }

    for (std::size_t i = 0; i < n; ++i) {
        const auto& layers = image.neighbors[i];
        if (layers.size() != image.levels[i] + std::size_t{1} || image.levels[i] > image.max_layer) {
            return corrupt("node " + std::to_string(i) + " has inconsistent layers");
        }
        for (std::size_t layer = 0; layer < layers.size(); ++layer) {
            const std::uint32_t bound = layer == 0 ? p.M0 : p.M;
            if (layers[layer].size() > bound) {
                return corrupt("node " + std::to_string(i) + " exceeds degree bound on layer " +
                               std::to_string(layer));
            }
            for (const std::uint32_t nb : layers[layer]) {
                if (nb >= n || nb == i || image.levels[nb] < layer) {
                    return corrupt("node " + std::to_string(i) + " has invalid neighbor " + std::to_string(nb));
                }
            }
        }
    }

    HnswIndex index;
    auto& impl = *index.impl_;
    impl.state_.dim = image.dim;
    impl.state_.params = p;
    impl.state_.capacity = n;
    impl.state_.scale = image.scale;
    impl.state_.l2_scale_sq = image.scale ? image.scale->scale * image.scale->scale : 1.0f;
    impl.state_.level_multiplier = 1.0 / std::log(static_cast<double>(p.M));
    impl.state_.verbose = p.verbose || core::verbose_from_env();
    impl.state_.ops = &kernels::select_backend_auto();
    impl.nodes_.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        impl.nodes_[i].level = image.levels[i];
        impl.nodes_[i].neighbors = std::move(image.neighbors[i]);
    }
    impl.vectors_ = std::move(image.vectors);
    impl.count_.store(n);
    impl.entry_point_ = n > 0 ? image.entry_point : kNoNode;
    impl.max_layer_ = n > 0 ? image.max_layer : 0;
    impl.state_.state.store(IndexState::built, std::memory_order_release);
    return index;
}

auto HnswIndex::state() const noexcept -> IndexState {
    return impl_->state_.state.load(std::memory_order_acquire);
}

auto HnswIndex::dimension() const noexcept -> std::size_t {
    return impl_->state_.dim;
}

auto HnswIndex::size() const noexcept -> std::size_t {
    return impl_->count_.load(std::memory_order_acquire);
}

auto HnswIndex::metric() const noexcept -> kernels::Metric {
    return impl_->state_.params.metric;
}

auto HnswIndex::is_quantized() const noexcept -> bool {
    return impl_->state_.scale.has_value();
}

auto HnswIndex::quantization_scale() const noexcept -> std::optional<QuantizationScale> {
    return impl_->state_.scale;
}

auto HnswIndex::build_params() const noexcept -> const HnswBuildParams& {
    return impl_->state_.params;
}

auto HnswIndex::entry_point() const noexcept -> std::uint32_t {
    std::shared_lock<std::shared_mutex> lock(impl_->entry_mutex_);
    return impl_->entry_point_;
}

auto HnswIndex::max_layer() const noexcept -> std::uint32_t {
    std::shared_lock<std::shared_mutex> lock(impl_->entry_mutex_);
    return impl_->max_layer_;
}

auto HnswIndex::level_of(std::uint32_t id) const -> std::expected<std::uint32_t, core::error> {
    if (id >= size()) {
        return std::unexpected(hnsw_error(core::error_code::out_of_range,
            "node " + std::to_string(id) + " does not exist"));
    }
    return impl_->nodes_[id].level;
}

auto HnswIndex::neighbors(std::uint32_t id, std::uint32_t layer) const
    -> std::expected<std::span<const std::uint32_t>, core::error> {
    if (auto ok = impl_->check_built(); !ok) return std::unexpected(ok.error());
    if (id >= size() || layer > impl_->nodes_[id].level) {
        return std::unexpected(hnsw_error(core::error_code::out_of_range,
            "node " + std::to_string(id) + " has no layer " + std::to_string(layer)));
    }
    return std::span<const std::uint32_t>(impl_->nodes_[id].neighbors[layer]);
}

auto HnswIndex::raw_vector(std::uint32_t id) const
    -> std::expected<std::span<const std::byte>, core::error> {
    if (auto ok = impl_->check_built(); !ok) return std::unexpected(ok.error());
    if (id >= size()) {
        return std::unexpected(hnsw_error(core::error_code::out_of_range,
            "node " + std::to_string(id) + " does not exist"));
    }
    return std::span<const std::byte>(impl_->vectors_.row(id), impl_->vectors_.row_bytes());
}

auto HnswIndex::get_stats() const noexcept -> HnswStats {
    HnswStats stats;
    const std::size_t n = size();
    stats.n_nodes = n;

    std::size_t max_level = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const auto& node = impl_->nodes_[i];
        max_level = std::max(max_level, static_cast<std::size_t>(node.level));
        if (stats.level_counts.size() <= node.level) {
            stats.level_counts.resize(node.level + 1, 0);
        }
        stats.level_counts[node.level]++;

        const auto degree = impl_->degree(static_cast<std::uint32_t>(i), 0);
        stats.n_edges += degree;
        stats.max_degree = std::max(stats.max_degree, degree);
        for (const auto& layer : node.neighbors) {
            stats.memory_bytes += layer.capacity() * sizeof(std::uint32_t);
        }
    }

    stats.n_levels = n > 0 ? max_level + 1 : 0;
    stats.avg_degree = n > 0 ? static_cast<float>(stats.n_edges) / static_cast<float>(n) : 0.0f;
    stats.memory_bytes += sizeof(Impl) + impl_->nodes_.capacity() * sizeof(HnswNode) +
                          impl_->vectors_.heap_bytes();
    return stats;
}

auto HnswIndex::reachable_count_base_layer() const noexcept -> std::size_t {
    try {
        return impl_->reachable_count_base_layer();
    } catch (const std::bad_alloc&) {
        return 0;
    }
}

auto compute_recall(const HnswIndex& index,
                    const float* queries, std::size_t n_queries,
                    const std::uint32_t* ground_truth, std::size_t k,
                    const HnswSearchParams& params) -> std::expected<float, core::error> {
    if (queries == nullptr || ground_truth == nullptr || n_queries == 0 || k == 0) {
        return std::unexpected(hnsw_error(core::error_code::invalid_argument,
            "recall needs at least one query and k > 0"));
    }
    auto results = index.search_batch(std::span<const float>(queries, n_queries * index.dimension()),
                                      n_queries, params);
    if (!results) {
        return std::unexpected(results.error());
    }

    std::size_t total_found = 0;
    for (std::size_t q = 0; q < n_queries; ++q) {
        const auto& found = (*results)[q];
        const std::uint32_t* gt = ground_truth + q * k;
        for (std::size_t i = 0; i < found.size() && i < k; ++i) {
            if (std::find(gt, gt + k, found[i].first) != gt + k) {
                ++total_found;
            }
        }
    }
    return static_cast<float>(total_found) / static_cast<float>(n_queries * k);
}

} // namespace semsearch::index
