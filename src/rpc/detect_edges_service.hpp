#pragma once

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "canny_edge.grpc.pb.h"
#include "stream/session_limiter.hpp"
#include "stream/stream_session.hpp"
#include "transform/image_transform.hpp"

namespace edge_rpc {

using TransformFactory =
    std::function<std::unique_ptr<edge_transform::ImageTransform>()>;

struct ServiceOptions {
  size_t chunk_size = edge_stream::kDefaultChunkSize;
  std::chrono::milliseconds admission_timeout{30000};
};

/**
 * @brief Synchronous handler for CannyEdgeDetector.DetectEdges.
 *
 * Each call runs one StreamSession on the gRPC handler thread that owns it.
 * A permit from the shared SessionLimiter is held for the whole call; when
 * none frees up within the admission timeout the call ends with
 * RESOURCE_EXHAUSTED before anything is read.
 *
 * Every session gets its own transform instance from the factory, so no
 * mutable state is shared between calls.
 */
class DetectEdgesService final
    : public canny_edge::v1::CannyEdgeDetector::Service {
public:
  DetectEdgesService(edge_stream::SessionLimiter &limiter,
                     TransformFactory transform_factory,
                     ServiceOptions options = {});

  grpc::Status
  DetectEdges(grpc::ServerContext *context,
              grpc::ServerReaderWriter<canny_edge::v1::DetectEdgesResponse,
                                       canny_edge::v1::DetectEdgesRequest>
                  *stream) override;

  uint64_t sessions_started() const { return next_session_id_.load() - 1; }

private:
  edge_stream::SessionLimiter &limiter_;
  TransformFactory transform_factory_;
  ServiceOptions options_;
  std::atomic<uint64_t> next_session_id_{1};
};

// Terminal gRPC status for a finished session.
grpc::Status to_grpc_status(const edge_stream::SessionOutcome &outcome);

} // namespace edge_rpc
