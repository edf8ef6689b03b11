#include "semsearch/serve/batch_scheduler.hpp"
#include "semsearch/core/platform_utils.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <system_error>

namespace semsearch::serve {

namespace {

using Clock = std::chrono::steady_clock;

auto scheduler_error(core::error_code code, std::string msg) -> core::error {
    return core::error{code, std::move(msg), "serve.batch"};
}

auto elapsed_ns(Clock::time_point from, Clock::time_point to) -> std::uint64_t {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(to - from).count());
}

/** \brief Holds one embedding slot for the scope. */
class SlotGuard {
public:
    explicit SlotGuard(std::counting_semaphore<>* slots) : slots_(slots) {
        if (slots_) slots_->acquire();
    }
    ~SlotGuard() {
        if (slots_) slots_->release();
    }
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    std::counting_semaphore<>* slots_;
};

} // namespace

auto BatchScheduler::create(std::shared_ptr<const index::HnswIndex> index,
                            std::shared_ptr<embed::EmbeddingBackend> backend,
                            const BatchSchedulerConfig& config)
    -> std::expected<std::unique_ptr<BatchScheduler>, core::error> {
    if (!index || !backend) {
        return std::unexpected(scheduler_error(core::error_code::invalid_argument, "index and backend are required"));
    }
    if (index->state() != index::IndexState::built) {
        return std::unexpected(scheduler_error(core::error_code::not_built, "scheduler requires a built index"));
    }
    if (backend->dimension() != index->dimension()) {
        return std::unexpected(scheduler_error(core::error_code::config_invalid,
            "embedding dimension " + std::to_string(backend->dimension()) +
            " does not match index dimension " + std::to_string(index->dimension())));
    }
    if (config.max_batch_size == 0) {
        return std::unexpected(scheduler_error(core::error_code::config_invalid, "max_batch_size must be > 0"));
    }
    if (config.max_k <= 0) {
        return std::unexpected(scheduler_error(core::error_code::config_invalid, "max_k must be > 0"));
    }
    try {
        return std::unique_ptr<BatchScheduler>(new BatchScheduler(std::move(index), std::move(backend), config));
    } catch (const std::system_error& e) {
        return std::unexpected(scheduler_error(core::error_code::resource_exhausted,
            std::string("cannot start scheduler threads: ") + e.what()));
    }
}

BatchScheduler::BatchScheduler(std::shared_ptr<const index::HnswIndex> index,
                               std::shared_ptr<embed::EmbeddingBackend> backend,
                               const BatchSchedulerConfig& config)
    : index_(std::move(index))
    , backend_(std::move(backend))
    , config_(config)
    , verbose_(config.verbose || core::verbose_from_env())
    , pool_(config.num_workers, "semsearch-batch") {
    if (const auto limit = backend_->max_concurrency(); limit > 0) {
        embed_slots_ = std::make_unique<std::counting_semaphore<>>(static_cast<std::ptrdiff_t>(limit));
    }
    dispatcher_ = std::thread([this] { dispatch_loop(); });
}

BatchScheduler::~BatchScheduler() {
    shutdown();
}

auto BatchScheduler::submit(std::vector<std::string> texts, std::int32_t k) -> std::future<Reply> {
    std::promise<Reply> promise;
    auto future = promise.get_future();

    if (k <= 0 || k > config_.max_k) {
        promise.set_value(std::unexpected(scheduler_error(core::error_code::invalid_argument,
            "k must be in [1, " + std::to_string(config_.max_k) + "], got " + std::to_string(k))));
        return future;
    }
    if (texts.empty()) {
        promise.set_value(PredictResult{});
        return future;
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_) {
            promise.set_value(std::unexpected(scheduler_error(core::error_code::unavailable,
                                                              "scheduler is shutting down")));
            return future;
        }
        queued_texts_ += texts.size();
        queue_.push_back(Pending{std::move(texts), k, std::move(promise), Clock::now()});
    }
    cv_.notify_one();
    return future;
}

auto BatchScheduler::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    pool_.wait_all();
}

auto BatchScheduler::stats() const noexcept -> SchedulerStats {
    return SchedulerStats{batches_.load(), requests_.load(), texts_.load(), failed_batches_.load()};
}

auto BatchScheduler::dispatch_loop() -> void {
    for (;;) {
        std::vector<Pending> batch;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // Stopping and drained
            }
            const auto deadline = queue_.front().enqueued + config_.max_wait;
            cv_.wait_until(lock, deadline, [this] {
                return stopping_ || queued_texts_ >= config_.max_batch_size;
            });

            std::size_t taken = 0;
            while (!queue_.empty()) {
                const auto size = queue_.front().texts.size();
                if (!batch.empty() && taken + size > config_.max_batch_size) break;
                taken += size;
                queued_texts_ -= size;
                batch.push_back(std::move(queue_.front()));
                queue_.pop_front();
            }
        }

        auto shared = std::make_shared<std::vector<Pending>>(std::move(batch));
        try {
            pool_.submit([this, shared] { run_batch(*shared); });
        } catch (const std::exception& e) {
            fail_batch(*shared, scheduler_error(core::error_code::unavailable,
                                                std::string("cannot schedule batch: ") + e.what()));
        }
    }
}

auto BatchScheduler::fail_batch(std::vector<Pending>& batch, const core::error& e) -> void {
    for (auto& request : batch) {
        request.promise.set_value(std::unexpected(e));
    }
}

auto BatchScheduler::run_batch(std::vector<Pending>& batch) noexcept -> void {
    try {
        std::vector<std::string> texts;
        std::int32_t max_k = 0;
        for (auto& request : batch) {
            max_k = std::max(max_k, request.k);
            for (auto& t : request.texts) texts.push_back(std::move(t));
        }
        batches_.fetch_add(1, std::memory_order_relaxed);
        requests_.fetch_add(batch.size(), std::memory_order_relaxed);
        texts_.fetch_add(texts.size(), std::memory_order_relaxed);

        const auto t0 = Clock::now();
        std::expected<std::vector<float>, core::error> embedded;
        try {
            SlotGuard slot(embed_slots_.get());
            embedded = backend_->embed(texts);
        } catch (const std::exception& e) {
            embedded = std::unexpected(scheduler_error(core::error_code::embedding_failed,
                                                       std::string("embedding backend threw: ") + e.what()));
        }
        if (embedded && embedded->size() != texts.size() * index_->dimension()) {
            embedded = std::unexpected(scheduler_error(core::error_code::embedding_failed,
                "embedding backend returned " + std::to_string(embedded->size()) + " values for " +
                std::to_string(texts.size()) + " texts"));
        }
        if (!embedded) {
            auto e = embedded.error();
            e.code = core::error_code::embedding_failed;
            failed_batches_.fetch_add(1, std::memory_order_relaxed);
            if (verbose_) {
                std::cerr << "[serve][batch] embedding failed for " << batch.size()
                          << " requests: " << core::describe(e) << std::endl;
            }
            fail_batch(batch, e);
            return;
        }
        const auto t1 = Clock::now();

        index::HnswSearchParams params;
        params.k = static_cast<std::uint32_t>(max_k);
        params.ef_search = std::max(config_.ef_search, params.k);
        auto found = index_->search_batch(*embedded, texts.size(), params);
        const auto t2 = Clock::now();
        if (!found) {
            failed_batches_.fetch_add(1, std::memory_order_relaxed);
            fail_batch(batch, found.error());
            return;
        }

        const auto model_ns = elapsed_ns(t0, t1);
        const auto search_ns = elapsed_ns(t1, t2);
        const std::size_t n = index_->size();
        std::size_t row = 0;
        for (auto& request : batch) {
            PredictResult result;
            result.model_latency_ns = model_ns;
            result.search_latency_ns = search_ns;
            result.truncated = n < static_cast<std::size_t>(request.k);
            result.indices.reserve(request.texts.size());
            for (std::size_t i = 0; i < request.texts.size(); ++i, ++row) {
                const auto& hits = (*found)[row];
                const auto take = std::min(hits.size(), static_cast<std::size_t>(request.k));
                std::vector<std::int32_t> ids(take);
                for (std::size_t j = 0; j < take; ++j) {
                    ids[j] = static_cast<std::int32_t>(hits[j].first);
                }
                result.indices.push_back(std::move(ids));
            }
            request.promise.set_value(std::move(result));
        }

        if (verbose_) {
            std::cerr << "[serve][batch] requests=" << batch.size() << " texts=" << texts.size()
                      << " k=" << max_k << " model_us=" << model_ns / 1000
                      << " search_us=" << search_ns / 1000 << std::endl;
        }
    } catch (const std::exception& e) {
        // Promises already satisfied throw future_error; the rest get the failure.
        const auto err = scheduler_error(core::error_code::internal, std::string("batch failed: ") + e.what());
        for (auto& request : batch) {
            try {
                request.promise.set_value(std::unexpected(err));
            } catch (const std::future_error&) {
                // Already satisfied.
            }
        }
    }
}

} // namespace semsearch::serve
