#include <catch2/catch_all.hpp>

#include <semsearch/embed/embedding_backend.hpp>
#include <semsearch/index/index_builder.hpp>
#include <semsearch/serve/batch_scheduler.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <latch>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace semsearch;
using namespace std::chrono_literals;
using core::error_code;
using serve::BatchScheduler;
using serve::BatchSchedulerConfig;

namespace {

constexpr std::size_t kDim = 64;

auto documents(std::size_t n) -> std::vector<std::string> {
    std::vector<std::string> docs;
    for (std::size_t i = 0; i < n; ++i) {
        docs.push_back("topic " + std::to_string(i) + " item " + std::to_string(i * 7 + 3) +
                       " shard " + std::to_string(i % 5));
    }
    return docs;
}

auto make_index(const std::vector<std::string>& docs) -> std::shared_ptr<const index::HnswIndex> {
    embed::HashingEmbedder embedder(kDim);
    auto vectors = embedder.embed(docs);
    REQUIRE(vectors.has_value());
    index::IndexBuildConfig cfg;
    cfg.hnsw.M = 8;
    cfg.hnsw.ef_construction = 100;
    cfg.hnsw.num_threads = 1;
    auto built = index::build_index(*vectors, kDim, cfg);
    REQUIRE(built.has_value());
    return std::make_shared<const index::HnswIndex>(std::move(*built));
}

class FailingBackend final : public embed::EmbeddingBackend {
public:
    auto dimension() const noexcept -> std::size_t override { return kDim; }
    auto embed(std::span<const std::string>)
        -> std::expected<std::vector<float>, core::error> override {
        calls.fetch_add(1);
        return std::unexpected(core::error{error_code::unavailable, "model offline", "test"});
    }
    std::atomic<int> calls{0};
};

class ThrowingBackend final : public embed::EmbeddingBackend {
public:
    auto dimension() const noexcept -> std::size_t override { return kDim; }
    auto embed(std::span<const std::string>)
        -> std::expected<std::vector<float>, core::error> override {
        throw std::runtime_error("tokenizer crashed");
    }
};

/** \brief Hashing embedder limited to one concurrent call; records observed overlap. */
class SerialBackend final : public embed::EmbeddingBackend {
public:
    auto dimension() const noexcept -> std::size_t override { return kDim; }
    auto max_concurrency() const noexcept -> std::size_t override { return 1; }
    auto embed(std::span<const std::string> texts)
        -> std::expected<std::vector<float>, core::error> override {
        const int now = in_flight.fetch_add(1) + 1;
        int seen = max_seen.load();
        while (now > seen && !max_seen.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(2ms);
        auto out = inner.embed(texts);
        in_flight.fetch_sub(1);
        return out;
    }
    embed::HashingEmbedder inner{kDim};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_seen{0};
};

} // namespace

TEST_CASE("results are split back to their requests", "[serve][batch]") {
    const auto docs = documents(120);
    auto idx = make_index(docs);
    BatchSchedulerConfig cfg;
    cfg.max_batch_size = 16;
    cfg.max_wait = 20ms;
    cfg.num_workers = 2;
    auto sched = BatchScheduler::create(idx, std::make_shared<embed::HashingEmbedder>(kDim), cfg);
    REQUIRE(sched.has_value());

    auto f1 = (*sched)->submit({docs[5]}, 1);
    auto f2 = (*sched)->submit({docs[17], docs[42], docs[99]}, 3);
    auto f3 = (*sched)->submit({docs[0], docs[64]}, 10);

    auto r1 = f1.get();
    auto r2 = f2.get();
    auto r3 = f3.get();
    REQUIRE(r1.has_value());
    REQUIRE(r2.has_value());
    REQUIRE(r3.has_value());

    REQUIRE(r1->indices.size() == 1);
    REQUIRE(r1->indices[0] == std::vector<std::int32_t>{5});

    REQUIRE(r2->indices.size() == 3);
    CHECK(r2->indices[0].size() == 3);
    CHECK(r2->indices[0][0] == 17);
    CHECK(r2->indices[1][0] == 42);
    CHECK(r2->indices[2][0] == 99);

    REQUIRE(r3->indices.size() == 2);
    CHECK(r3->indices[0].size() == 10);
    CHECK(r3->indices[0][0] == 0);
    CHECK(r3->indices[1][0] == 64);
    CHECK_FALSE(r3->truncated);

    (*sched)->shutdown();
    const auto stats = (*sched)->stats();
    CHECK(stats.requests == 3);
    CHECK(stats.texts == 6);
    CHECK(stats.batches >= 1);
    CHECK(stats.failed_batches == 0);
}

TEST_CASE("concurrent submitters each get their own results", "[serve][batch][concurrency]") {
    constexpr std::size_t kSubmitters = 16;
    const auto docs = documents(64);
    auto idx = make_index(docs);
    BatchSchedulerConfig cfg;
    cfg.max_batch_size = 64;
    cfg.max_wait = 200ms;
    cfg.num_workers = 2;
    auto sched = BatchScheduler::create(idx, std::make_shared<embed::HashingEmbedder>(kDim), cfg);
    REQUIRE(sched.has_value());

    std::vector<BatchScheduler::Reply> replies(kSubmitters);
    std::latch start(static_cast<std::ptrdiff_t>(kSubmitters));
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < kSubmitters; ++i) {
        threads.emplace_back([&, i] {
            start.arrive_and_wait();
            replies[i] = (*sched)->submit({docs[i * 3]}, 1).get();
        });
    }
    for (auto& t : threads) t.join();

    for (std::size_t i = 0; i < kSubmitters; ++i) {
        INFO("submitter " << i);
        REQUIRE(replies[i].has_value());
        REQUIRE(replies[i]->indices.size() == 1);
        REQUIRE(replies[i]->indices[0].front() == static_cast<std::int32_t>(i * 3));
    }
    (*sched)->shutdown();
    const auto stats = (*sched)->stats();
    CHECK(stats.requests == kSubmitters);
    CHECK(stats.batches < kSubmitters);
}

TEST_CASE("single-text batches dispatch without waiting", "[serve][batch]") {
    const auto docs = documents(40);
    auto idx = make_index(docs);
    BatchSchedulerConfig cfg;
    cfg.max_batch_size = 1;
    cfg.max_wait = 0us;
    auto sched = BatchScheduler::create(idx, std::make_shared<embed::HashingEmbedder>(kDim), cfg);
    REQUIRE(sched.has_value());

    for (int i = 0; i < 10; ++i) {
        auto fut = (*sched)->submit({docs[static_cast<std::size_t>(i)]}, 2);
        REQUIRE(fut.wait_for(5s) == std::future_status::ready);
        auto r = fut.get();
        REQUIRE(r.has_value());
        REQUIRE(r->indices[0].front() == i);
    }
    (*sched)->shutdown();
    REQUIRE((*sched)->stats().batches == 10);
}

TEST_CASE("embedding failure fails the whole batch", "[serve][batch][errors]") {
    auto idx = make_index(documents(20));
    auto backend = std::make_shared<FailingBackend>();
    BatchSchedulerConfig cfg;
    cfg.max_batch_size = 3;
    cfg.max_wait = 2s;
    auto sched = BatchScheduler::create(idx, backend, cfg);
    REQUIRE(sched.has_value());

    std::vector<std::future<BatchScheduler::Reply>> futures;
    for (int i = 0; i < 3; ++i) futures.push_back((*sched)->submit({"query"}, 1));
    for (auto& f : futures) {
        auto r = f.get();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == error_code::embedding_failed);
    }
    (*sched)->shutdown();
    REQUIRE(backend->calls.load() == 1);
    REQUIRE((*sched)->stats().failed_batches == 1);
}

TEST_CASE("throwing backend surfaces embedding_failed", "[serve][batch][errors]") {
    auto idx = make_index(documents(20));
    BatchSchedulerConfig cfg;
    cfg.max_wait = 0us;
    auto sched = BatchScheduler::create(idx, std::make_shared<ThrowingBackend>(), cfg);
    REQUIRE(sched.has_value());
    auto r = (*sched)->submit({"a", "b"}, 1).get();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::embedding_failed);
}

TEST_CASE("request validation", "[serve][batch][errors]") {
    auto idx = make_index(documents(20));
    BatchSchedulerConfig cfg;
    cfg.max_k = 50;
    auto sched = BatchScheduler::create(idx, std::make_shared<embed::HashingEmbedder>(kDim), cfg);
    REQUIRE(sched.has_value());

    auto zero_k = (*sched)->submit({"x"}, 0).get();
    REQUIRE_FALSE(zero_k.has_value());
    REQUIRE(zero_k.error().code == error_code::invalid_argument);

    auto big_k = (*sched)->submit({"x"}, 51).get();
    REQUIRE_FALSE(big_k.has_value());
    REQUIRE(big_k.error().code == error_code::invalid_argument);

    auto empty = (*sched)->submit({}, 5).get();
    REQUIRE(empty.has_value());
    REQUIRE(empty->indices.empty());

    (*sched)->shutdown();
    (*sched)->shutdown();
    auto late = (*sched)->submit({"x"}, 1).get();
    REQUIRE_FALSE(late.has_value());
    REQUIRE(late.error().code == error_code::unavailable);
}

TEST_CASE("k above the index size is truncated", "[serve][batch]") {
    auto idx = make_index(documents(5));
    BatchSchedulerConfig cfg;
    cfg.max_wait = 0us;
    auto sched = BatchScheduler::create(idx, std::make_shared<embed::HashingEmbedder>(kDim), cfg);
    REQUIRE(sched.has_value());
    auto r = (*sched)->submit({"topic 1"}, 10).get();
    REQUIRE(r.has_value());
    REQUIRE(r->truncated);
    REQUIRE(r->indices[0].size() == 5);

    auto ids = r->indices[0];
    std::sort(ids.begin(), ids.end());
    REQUIRE(ids == std::vector<std::int32_t>{0, 1, 2, 3, 4});
}

TEST_CASE("scheduler creation checks its inputs", "[serve][batch][errors]") {
    auto idx = make_index(documents(10));
    BatchSchedulerConfig cfg;

    auto wrong_dim = BatchScheduler::create(idx, std::make_shared<embed::HashingEmbedder>(kDim + 1), cfg);
    REQUIRE_FALSE(wrong_dim.has_value());
    REQUIRE(wrong_dim.error().code == error_code::config_invalid);

    auto unbuilt = std::make_shared<index::HnswIndex>();
    REQUIRE(unbuilt->init(kDim, index::HnswBuildParams{}, 4).has_value());
    auto building = BatchScheduler::create(unbuilt, std::make_shared<embed::HashingEmbedder>(kDim), cfg);
    REQUIRE_FALSE(building.has_value());
    REQUIRE(building.error().code == error_code::not_built);

    BatchSchedulerConfig zero_batch;
    zero_batch.max_batch_size = 0;
    auto bad = BatchScheduler::create(idx, std::make_shared<embed::HashingEmbedder>(kDim), zero_batch);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == error_code::config_invalid);
}

TEST_CASE("backend concurrency limit is honored", "[serve][batch]") {
    const auto docs = documents(30);
    auto idx = make_index(docs);
    auto backend = std::make_shared<SerialBackend>();
    BatchSchedulerConfig cfg;
    cfg.max_batch_size = 1;
    cfg.max_wait = 0us;
    cfg.num_workers = 4;
    auto sched = BatchScheduler::create(idx, backend, cfg);
    REQUIRE(sched.has_value());

    std::vector<std::future<BatchScheduler::Reply>> futures;
    for (std::size_t i = 0; i < 12; ++i) futures.push_back((*sched)->submit({docs[i]}, 1));
    for (std::size_t i = 0; i < futures.size(); ++i) {
        auto r = futures[i].get();
        REQUIRE(r.has_value());
        REQUIRE(r->indices[0][0] == static_cast<std::int32_t>(i));
    }
    REQUIRE(backend->max_seen.load() == 1);
}
