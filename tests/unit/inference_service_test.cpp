#include <catch2/catch_all.hpp>

#include <semsearch/embed/embedding_backend.hpp>
#include <semsearch/index/index_builder.hpp>
#include <semsearch/serve/inference_service.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

using namespace std::chrono_literals;
using semsearch::core::error;
using semsearch::core::error_code;
namespace serve = semsearch::serve;

namespace {

constexpr std::size_t kDim = 48;

auto corpus(std::size_t n) -> std::vector<std::string> {
    std::vector<std::string> docs;
    for (std::size_t i = 0; i < n; ++i) {
        docs.push_back("entry " + std::to_string(i) + " colour " + std::to_string(i * 13 % 31));
    }
    return docs;
}

auto build(const std::vector<std::string>& docs) -> std::shared_ptr<const semsearch::index::HnswIndex> {
    semsearch::embed::HashingEmbedder embedder(kDim);
    auto vectors = embedder.embed(docs);
    REQUIRE(vectors.has_value());
    semsearch::index::IndexBuildConfig cfg;
    cfg.hnsw.M = 8;
    cfg.hnsw.num_threads = 1;
    auto built = semsearch::index::build_index(*vectors, kDim, cfg);
    REQUIRE(built.has_value());
    return std::make_shared<const semsearch::index::HnswIndex>(std::move(*built));
}

class SlowBackend final : public semsearch::embed::EmbeddingBackend {
public:
    auto dimension() const noexcept -> std::size_t override { return kDim; }
    auto embed(std::span<const std::string> texts)
        -> std::expected<std::vector<float>, error> override {
        std::this_thread::sleep_for(400ms);
        return inner_.embed(texts);
    }

private:
    semsearch::embed::HashingEmbedder inner_{kDim};
};

class DownBackend final : public semsearch::embed::EmbeddingBackend {
public:
    auto dimension() const noexcept -> std::size_t override { return kDim; }
    auto embed(std::span<const std::string>)
        -> std::expected<std::vector<float>, error> override {
        return std::unexpected(error{error_code::internal, "model crashed", "test"});
    }
};

/** \brief In-process server around one scheduler. */
struct ServiceHarness {
    explicit ServiceHarness(std::shared_ptr<semsearch::embed::EmbeddingBackend> backend,
                            std::size_t n_docs = 60)
        : docs(corpus(n_docs)) {
        serve::BatchSchedulerConfig cfg;
        cfg.max_wait = 1ms;
        auto created = serve::BatchScheduler::create(build(docs), std::move(backend), cfg);
        REQUIRE(created.has_value());
        scheduler = std::shared_ptr<serve::BatchScheduler>(std::move(*created));
        service = std::make_unique<serve::InferenceServiceImpl>(scheduler);

        grpc::ServerBuilder builder;
        builder.RegisterService(service.get());
        server = builder.BuildAndStart();
        REQUIRE(server != nullptr);
        stub = semsearch::Inference::NewStub(server->InProcessChannel(grpc::ChannelArguments()));
    }

    ~ServiceHarness() {
        server->Shutdown();
        scheduler->shutdown();
    }

    std::vector<std::string> docs;
    std::shared_ptr<serve::BatchScheduler> scheduler;
    std::unique_ptr<serve::InferenceServiceImpl> service;
    std::unique_ptr<grpc::Server> server;
    std::unique_ptr<semsearch::Inference::Stub> stub;
};

auto request_for(const std::vector<std::string>& queries, int k) -> semsearch::PredictRequest {
    semsearch::PredictRequest req;
    for (const auto& q : queries) req.add_features()->set_query(q);
    req.set_k(k);
    return req;
}

} // namespace

TEST_CASE("error codes map onto gRPC statuses", "[serve][grpc]") {
    auto code_of = [](error_code c) { return serve::to_grpc_status(error{c, "m", "comp"}).error_code(); };
    CHECK(code_of(error_code::invalid_argument) == grpc::StatusCode::INVALID_ARGUMENT);
    CHECK(code_of(error_code::dimension_mismatch) == grpc::StatusCode::INVALID_ARGUMENT);
    CHECK(code_of(error_code::embedding_failed) == grpc::StatusCode::UNAVAILABLE);
    CHECK(code_of(error_code::unavailable) == grpc::StatusCode::UNAVAILABLE);
    CHECK(code_of(error_code::not_built) == grpc::StatusCode::FAILED_PRECONDITION);
    CHECK(code_of(error_code::deadline_exceeded) == grpc::StatusCode::DEADLINE_EXCEEDED);
    CHECK(code_of(error_code::cancelled) == grpc::StatusCode::CANCELLED);
    CHECK(code_of(error_code::data_integrity) == grpc::StatusCode::INTERNAL);
    CHECK(serve::to_grpc_status(error{error_code::internal, "boom", "serve.batch"}).error_message() ==
          "serve.batch: boom");
}

TEST_CASE("Predict returns neighbors per query in order", "[serve][grpc]") {
    ServiceHarness h(std::make_shared<semsearch::embed::HashingEmbedder>(kDim));

    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + 10s);
    semsearch::PredictResponse resp;
    auto status = h.stub->Predict(&ctx, request_for({h.docs[3], h.docs[27]}, 4), &resp);
    REQUIRE(status.ok());
    REQUIRE(resp.indices_size() == 2);
    REQUIRE(resp.indices(0).index_size() == 4);
    REQUIRE(resp.indices(1).index_size() == 4);
    CHECK(resp.indices(0).index(0) == 3);
    CHECK(resp.indices(1).index(0) == 27);
    CHECK(resp.model_latency() > 0);
    CHECK(ctx.GetServerTrailingMetadata().count(serve::kTruncatedMetadataKey) == 0);
}

TEST_CASE("Predict flags results shorter than k", "[serve][grpc]") {
    ServiceHarness h(std::make_shared<semsearch::embed::HashingEmbedder>(kDim), 3);

    grpc::ClientContext ctx;
    semsearch::PredictResponse resp;
    auto status = h.stub->Predict(&ctx, request_for({"entry 1"}, 10), &resp);
    REQUIRE(status.ok());
    REQUIRE(resp.indices(0).index_size() == 3);
    const auto& trailers = ctx.GetServerTrailingMetadata();
    auto it = trailers.find(serve::kTruncatedMetadataKey);
    REQUIRE(it != trailers.end());
    CHECK(std::string(it->second.data(), it->second.size()) == "1");
}

TEST_CASE("Predict rejects invalid k", "[serve][grpc][errors]") {
    ServiceHarness h(std::make_shared<semsearch::embed::HashingEmbedder>(kDim));
    grpc::ClientContext ctx;
    semsearch::PredictResponse resp;
    auto status = h.stub->Predict(&ctx, request_for({"entry"}, 0), &resp);
    CHECK(status.error_code() == grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_CASE("Predict with no features returns an empty response", "[serve][grpc]") {
    ServiceHarness h(std::make_shared<semsearch::embed::HashingEmbedder>(kDim));
    grpc::ClientContext ctx;
    semsearch::PredictResponse resp;
    auto status = h.stub->Predict(&ctx, request_for({}, 5), &resp);
    REQUIRE(status.ok());
    CHECK(resp.indices_size() == 0);
}

TEST_CASE("embedding failure is reported as unavailable", "[serve][grpc][errors]") {
    ServiceHarness h(std::make_shared<DownBackend>());
    grpc::ClientContext ctx;
    semsearch::PredictResponse resp;
    auto status = h.stub->Predict(&ctx, request_for({"a", "b"}, 1), &resp);
    CHECK(status.error_code() == grpc::StatusCode::UNAVAILABLE);
}

TEST_CASE("Predict honors the call deadline", "[serve][grpc][errors]") {
    ServiceHarness h(std::make_shared<SlowBackend>());
    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + 50ms);
    semsearch::PredictResponse resp;
    auto status = h.stub->Predict(&ctx, request_for({"entry 2"}, 1), &resp);
    CHECK(status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED);
}
