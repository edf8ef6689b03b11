#pragma once

/** \file thread_pool.hpp
 *  \brief Bounded FIFO worker pool shared by the index builder and the batch scheduler.
 *
 * One centralized task queue guarded by a mutex. Tasks are type-erased packaged_tasks, so
 * exceptions thrown by a task surface at the returned future.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace semsearch::core {

class ThreadPool {
public:
    /** \brief Construct the pool.
     *
     * \param num_threads Number of worker threads (0 = hardware concurrency)
     * \param name OS thread name for workers (truncated to 15 chars on Linux)
     * \throws std::system_error if a worker cannot be started; workers already running are
     *         stopped and joined first
     */
    explicit ThreadPool(std::size_t num_threads = 0, std::string name = "semsearch-wrk")
        : name_(std::move(name)) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency());
        }
        workers_.reserve(num_threads);
        try {
            for (std::size_t i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] { worker_loop(); });
            }
        } catch (...) {
            request_stop();
            join_all();
            throw;
        }
    }

    ~ThreadPool() {
        request_stop();
        join_all();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /** \brief Submit a task.
     *
     * \return Future for the task result
     * \throws std::runtime_error if the pool is stopping
     */
    template<typename Func, typename... Args>
    auto submit(Func&& func, Args&&... args)
        -> std::future<std::invoke_result_t<Func, Args...>> {
        using return_type = std::invoke_result_t<Func, Args...>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<Func>(func), std::forward<Args>(args)...)
        );
        auto future = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("thread pool is stopped");
            }
            pending_.fetch_add(1, std::memory_order_relaxed);
            tasks_.emplace_back([this, task] {
                (*task)();
                auto rem = pending_.fetch_sub(1, std::memory_order_acq_rel) - 1;
                if (rem == 0) {
                    std::unique_lock<std::mutex> lk(queue_mutex_);
                    done_cv_.notify_all();
                }
            });
        }

        cv_.notify_one();
        return future;
    }

    /** \brief Execute [start, end) in chunks and wait; the first task exception is rethrown.
     *
     * \param chunk_size Indices per task (0 = auto, about four chunks per worker)
     */
    template<typename Func>
    auto parallel_for(std::size_t start, std::size_t end,
                      Func&& func, std::size_t chunk_size = 0) -> void {
        if (end <= start) return;
        if (chunk_size == 0) {
            chunk_size = std::max<std::size_t>(1, (end - start) / (workers_.size() * 4));
        }

        std::vector<std::future<void>> futures;
        futures.reserve((end - start + chunk_size - 1) / chunk_size);
        for (std::size_t i = start; i < end; i += chunk_size) {
            const auto chunk_end = std::min(i + chunk_size, end);
            futures.push_back(submit([i, chunk_end, &func] {
                for (std::size_t j = i; j < chunk_end; ++j) {
                    func(j);
                }
            }));
        }

        // Drain every future before rethrowing so no task outlives func.
        std::exception_ptr first;
        for (auto& future : futures) {
            try {
                future.get();
            } catch (...) {
                if (!first) first = std::current_exception();
            }
        }
        if (first) std::rethrow_exception(first);
    }

    [[nodiscard]] auto num_threads() const noexcept -> std::size_t {
        return workers_.size();
    }

    /** \brief Request cooperative stop. New submissions fail; workers exit when the queue drains. */
    auto request_stop() noexcept -> void {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto stopping() const noexcept -> bool {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return stop_;
    }

    /** \brief Wait until every submitted task has finished executing. */
    auto wait_all() -> void {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        done_cv_.wait(lock, [this] { return pending_.load(std::memory_order_acquire) == 0; });
    }

private:
    auto join_all() noexcept -> void {
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    auto worker_loop() -> void {
#if defined(__linux__)
        pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());
#endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::string name_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::atomic<std::size_t> pending_{0};
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;        // Workers: task available or stop
    std::condition_variable done_cv_;   // wait_all: pending reached zero
    bool stop_{false};
};

} // namespace semsearch::core
