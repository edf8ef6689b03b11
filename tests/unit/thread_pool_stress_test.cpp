#include <gtest/gtest.h>
#include <atomic>
#include <fstream>
#include <chrono>
#include <random>
#include <stdexcept>
#include <thread>

#include "semsearch/core/thread_pool.hpp"

#include <sys/resource.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

using semsearch::core::ThreadPool;

TEST(ThreadPoolStress, ChurnAndWaitAll) {
  const std::size_t nt = std::max(2u, std::thread::hardware_concurrency() / 2);
  ThreadPool pool(nt);

  std::atomic<std::uint64_t> planned{0};
  std::atomic<std::uint64_t> executed{0};

  // Tasks spawn follow-up tasks; wait_all must cover work submitted from workers.
  auto work = [&](auto&& self, int depth, std::uint32_t seed) -> void {
    executed.fetch_add(1, std::memory_order_relaxed);
    volatile float acc = 0.f;
    for (int i = 0; i < 128; ++i) acc += (i * 0.5f);
    (void)acc;

    if (depth < 3 && seed % 10 == 0) {
      planned.fetch_add(1, std::memory_order_relaxed);
      (void)pool.submit([&self, depth, seed] { self(self, depth + 1, seed / 10 + 1); });
    }
  };

  constexpr int rounds = 3;
  constexpr int base_tasks = 2000;
  std::mt19937 rng(42);
  for (int r = 0; r < rounds; ++r) {
    planned.store(base_tasks, std::memory_order_relaxed);
    executed.store(0, std::memory_order_relaxed);
    for (int i = 0; i < base_tasks; ++i) {
      const auto seed = static_cast<std::uint32_t>(rng());
      (void)pool.submit([&work, seed] { work(work, 0, seed); });
    }

    const auto start = std::chrono::steady_clock::now();
    while (true) {
      pool.wait_all();
      if (executed.load() == planned.load()) break;
      if (std::chrono::steady_clock::now() - start > 10s) break;
      std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(executed.load(), planned.load()) << "Round " << r << " mismatch";
  }
}

TEST(ThreadPoolStress, ManyFuturesMix) {
  ThreadPool pool(std::max(2u, std::thread::hardware_concurrency() / 2));

  constexpr int N = 1000;
  std::vector<std::future<void>> futs;
  futs.reserve(N);

  std::atomic<int> acc{0};
  for (int i = 0; i < N; ++i) {
    futs.emplace_back(pool.submit([&acc] { acc.fetch_add(1, std::memory_order_relaxed); }));
  }
  for (int i = 0; i < N; ++i) {
    (void)pool.submit([&acc] { acc.fetch_add(1, std::memory_order_relaxed); });
  }

  for (auto& f : futs) f.wait();
  pool.wait_all();

  EXPECT_EQ(acc.load(), 2 * N);
}

TEST(ThreadPoolStress, ParallelForCoversRangeOnce) {
  ThreadPool pool(4);
  std::vector<std::atomic<int>> hits(10007);
  pool.parallel_for(0, hits.size(), [&hits](std::size_t i) { hits[i].fetch_add(1); });
  for (const auto& h : hits) ASSERT_EQ(h.load(), 1);

  pool.parallel_for(5, 5, [](std::size_t) { FAIL() << "empty range must not run"; });
}

TEST(ThreadPoolStress, ParallelForRethrowsAfterDraining) {
  ThreadPool pool(3);
  std::atomic<int> ran{0};
  EXPECT_THROW(pool.parallel_for(0, 100, [&ran](std::size_t i) {
                 ran.fetch_add(1);
                 if (i == 37) throw std::runtime_error("bad row");
               }, 10),
               std::runtime_error);
  // Every chunk except the rest of the failing one still ran.
  EXPECT_GE(ran.load(), 91);
  pool.wait_all();
}

TEST(ThreadPoolStress, SubmitAfterStopThrows) {
  ThreadPool pool(2);
  pool.request_stop();
  EXPECT_TRUE(pool.stopping());
  EXPECT_THROW((void)pool.submit([] {}), std::runtime_error);
}

TEST(ThreadPoolStress, ZeroMeansHardwareConcurrency) {
  ThreadPool pool(0);
  EXPECT_GE(pool.num_threads(), 1u);
}

// Caps the address space a little above current usage so thread stacks run out.
class AddressSpaceCap {
public:
  explicit AddressSpaceCap(std::size_t headroom_bytes) {
    std::ifstream statm("/proc/self/statm");
    std::size_t vm_pages = 0;
    if (!(statm >> vm_pages) || ::getrlimit(RLIMIT_AS, &saved_) != 0) return;
    const rlim_t vm = static_cast<rlim_t>(vm_pages) * static_cast<rlim_t>(::sysconf(_SC_PAGESIZE));
    rlimit capped = saved_;
    capped.rlim_cur = vm + headroom_bytes;
    if (saved_.rlim_max != RLIM_INFINITY && capped.rlim_cur > saved_.rlim_max) return;
    active_ = ::setrlimit(RLIMIT_AS, &capped) == 0;
  }
  ~AddressSpaceCap() {
    if (active_) (void)::setrlimit(RLIMIT_AS, &saved_);
  }
  AddressSpaceCap(const AddressSpaceCap&) = delete;
  AddressSpaceCap& operator=(const AddressSpaceCap&) = delete;

  bool active() const { return active_; }

private:
  rlimit saved_{};
  bool active_{false};
};

TEST(ThreadPoolStress, FailedWorkerStartJoinsStartedWorkers) {
  bool threw = false;
  {
    AddressSpaceCap cap(64u << 20);
    if (!cap.active()) GTEST_SKIP() << "cannot lower RLIMIT_AS";
    try {
      ThreadPool pool(4096);
    } catch (const std::exception&) {
      threw = true;
    }
  }
  EXPECT_TRUE(threw);

  // The process is still healthy and a normal pool works.
  ThreadPool pool(2);
  EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

} // namespace
