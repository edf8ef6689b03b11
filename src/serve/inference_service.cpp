#include "semsearch/serve/inference_service.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace semsearch::serve {

auto to_grpc_status(const core::error& e) -> grpc::Status {
    using core::error_code;
    grpc::StatusCode code = grpc::StatusCode::INTERNAL;
    switch (e.code) {
        case error_code::invalid_argument:
        case error_code::dimension_mismatch:
            code = grpc::StatusCode::INVALID_ARGUMENT;
            break;
        case error_code::embedding_failed:
        case error_code::unavailable:
            code = grpc::StatusCode::UNAVAILABLE;
            break;
        case error_code::not_built:
            code = grpc::StatusCode::FAILED_PRECONDITION;
            break;
        case error_code::deadline_exceeded:
            code = grpc::StatusCode::DEADLINE_EXCEEDED;
            break;
        case error_code::cancelled:
            code = grpc::StatusCode::CANCELLED;
            break;
        default:
            break;
    }
    return grpc::Status(code, core::describe(e));
}

grpc::Status InferenceServiceImpl::Predict(grpc::ServerContext* context,
                                           const semsearch::PredictRequest* request,
                                           semsearch::PredictResponse* response) {
    std::vector<std::string> texts;
    texts.reserve(static_cast<std::size_t>(request->features_size()));
    for (const auto& f : request->features()) {
        texts.push_back(f.query());
    }

    auto future = scheduler_->submit(std::move(texts), request->k());

    // Waits in bounded slices so client cancellation is noticed without a deadline.
    const auto deadline = context->deadline();
    for (;;) {
        auto slice = std::chrono::system_clock::now() + std::chrono::milliseconds(50);
        if (deadline < slice) slice = deadline;
        if (future.wait_until(slice) == std::future_status::ready) break;
        if (std::chrono::system_clock::now() >= deadline) {
            return to_grpc_status(core::error{core::error_code::deadline_exceeded,
                                              "request deadline passed before the batch completed",
                                              "serve.inference"});
        }
        if (context->IsCancelled()) {
            return to_grpc_status(core::error{core::error_code::cancelled,
                                              "client cancelled the call", "serve.inference"});
        }
    }

    auto reply = future.get();
    if (!reply) {
        return to_grpc_status(reply.error());
    }

    for (const auto& ids : reply->indices) {
        auto* out = response->add_indices();
        out->mutable_index()->Reserve(static_cast<int>(ids.size()));
        for (const auto id : ids) {
            out->add_index(id);
        }
    }
    response->set_model_latency(reply->model_latency_ns);
    response->set_search_latency(reply->search_latency_ns);
    if (reply->truncated) {
        context->AddTrailingMetadata(kTruncatedMetadataKey, "1");
    }
    return grpc::Status::OK;
}

} // namespace semsearch::serve
