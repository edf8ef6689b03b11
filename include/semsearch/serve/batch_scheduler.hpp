#pragma once

/** \file batch_scheduler.hpp
 *  \brief Coalesces concurrent Predict requests into batches.
 *
 * A dispatcher thread closes a batch when the queued query texts reach max_batch_size or when
 * max_wait has elapsed since the oldest queued request arrived. Requests are never split; one
 * larger than max_batch_size forms a batch on its own. Each batch runs on the worker pool:
 * one embedding call for every text of the batch, one batched index search at the largest k,
 * then the results are split back by position and each request's promise is fulfilled.
 *
 * Failure is shared: if the embedding call fails, every request of that batch receives the
 * error; other batches are unaffected.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <future>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <thread>
#include <vector>

#include "semsearch/core/thread_pool.hpp"
#include "semsearch/embed/embedding_backend.hpp"
#include "semsearch/error.hpp"
#include "semsearch/index/hnsw.hpp"

namespace semsearch::serve {

/** \brief Scheduler configuration. */
struct BatchSchedulerConfig {
    std::size_t max_batch_size{32};                  /**< Query texts per batch */
    std::chrono::microseconds max_wait{2000};        /**< Oldest request's maximum queueing delay */
    std::uint32_t ef_search{64};                     /**< Search beam width (raised to k) */
    std::size_t num_workers{0};                      /**< Batch workers (0 = hardware) */
    std::int32_t max_k{1024};                        /**< Largest accepted k */
    bool verbose{false};                             /**< Log every batch to stderr */
};

/** \brief Outcome of one request. */
struct PredictResult {
    std::vector<std::vector<std::int32_t>> indices;  /**< One id list per query text, closest first */
    std::uint64_t model_latency_ns{0};               /**< Embedding time of the whole batch */
    std::uint64_t search_latency_ns{0};              /**< Search time of the whole batch */
    bool truncated{false};                           /**< Index holds fewer than k vectors */
};

/** \brief Cumulative counters. */
struct SchedulerStats {
    std::uint64_t batches{0};
    std::uint64_t requests{0};
    std::uint64_t texts{0};
    std::uint64_t failed_batches{0};
};

class BatchScheduler {
public:
    using Reply = std::expected<PredictResult, core::error>;

    /** \brief Start the dispatcher and workers.
     *
     * Errors: not_built (index not built), config_invalid (dimension mismatch between backend
     * and index, zero max_batch_size or max_k).
     */
    static auto create(std::shared_ptr<const index::HnswIndex> index,
                       std::shared_ptr<embed::EmbeddingBackend> backend,
                       const BatchSchedulerConfig& config)
        -> std::expected<std::unique_ptr<BatchScheduler>, core::error>;

    ~BatchScheduler();

    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    /** \brief Queue a request.
     *
     * Completes immediately with invalid_argument for k outside [1, max_k], with an empty result
     * for an empty text list, and with unavailable after shutdown().
     */
    auto submit(std::vector<std::string> texts, std::int32_t k) -> std::future<Reply>;

    /** \brief Stop accepting requests, finish everything queued, join the dispatcher. Idempotent. */
    auto shutdown() -> void;

    [[nodiscard]] auto stats() const noexcept -> SchedulerStats;
    [[nodiscard]] auto config() const noexcept -> const BatchSchedulerConfig& { return config_; }

private:
    struct Pending {
        std::vector<std::string> texts;
        std::int32_t k{0};
        std::promise<Reply> promise;
        std::chrono::steady_clock::time_point enqueued;
    };

    BatchScheduler(std::shared_ptr<const index::HnswIndex> index,
                   std::shared_ptr<embed::EmbeddingBackend> backend,
                   const BatchSchedulerConfig& config);

    auto dispatch_loop() -> void;
    auto run_batch(std::vector<Pending>& batch) noexcept -> void;
    static auto fail_batch(std::vector<Pending>& batch, const core::error& e) -> void;

    std::shared_ptr<const index::HnswIndex> index_;
    std::shared_ptr<embed::EmbeddingBackend> backend_;
    BatchSchedulerConfig config_;
    bool verbose_{false};

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Pending> queue_;
    std::size_t queued_texts_{0};
    bool stopping_{false};

    std::unique_ptr<std::counting_semaphore<>> embed_slots_;  // Null when the backend is unbounded
    core::ThreadPool pool_;
    std::thread dispatcher_;

    std::atomic<std::uint64_t> batches_{0};
    std::atomic<std::uint64_t> requests_{0};
    std::atomic<std::uint64_t> texts_{0};
    std::atomic<std::uint64_t> failed_batches_{0};
};

} // namespace semsearch::serve
