#pragma once

/** \file inference_service.hpp
 *  \brief gRPC Inference service backed by the batch scheduler.
 *
 * Each Predict call is submitted to the scheduler and the handler thread waits for the result
 * until the call's deadline. Scheduler errors map onto gRPC status codes; see to_grpc_status.
 */

#include <memory>

#include <grpcpp/grpcpp.h>

#include "semsearch.grpc.pb.h"
#include "semsearch/error.hpp"
#include "semsearch/serve/batch_scheduler.hpp"

namespace semsearch::serve {

/** \brief Trailing metadata key set to "1" when results are shorter than k. */
inline constexpr const char* kTruncatedMetadataKey = "semsearch-truncated";

/** \brief Map a library error onto a gRPC status ("component: message"). */
auto to_grpc_status(const core::error& e) -> grpc::Status;

class InferenceServiceImpl final : public semsearch::Inference::Service {
public:
    explicit InferenceServiceImpl(std::shared_ptr<BatchScheduler> scheduler) noexcept
        : scheduler_(std::move(scheduler)) {}

    grpc::Status Predict(grpc::ServerContext* context,
                         const semsearch::PredictRequest* request,
                         semsearch::PredictResponse* response) override;

private:
    std::shared_ptr<BatchScheduler> scheduler_;
};

} // namespace semsearch::serve
