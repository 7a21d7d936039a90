#include "rpc/detect_edges_service.hpp"

#include <string>
#include <utility>

#include "core/log.hpp"
#include "rpc/wire_adapter.hpp"
#include "stream/errors.hpp"

namespace edge_rpc {

using canny_edge::v1::DetectEdgesRequest;
using canny_edge::v1::DetectEdgesResponse;
using edge_stream::ErrorKind;
using edge_stream::SessionOutcome;
using edge_stream::TransportError;

namespace {

using Stream = grpc::ServerReaderWriter<DetectEdgesResponse, DetectEdgesRequest>;

class GrpcPartSource : public edge_stream::PartSource {
public:
  GrpcPartSource(grpc::ServerContext &ctx, Stream &stream)
      : ctx_(ctx), stream_(stream) {}

  bool next(edge_stream::Part &part) override {
    DetectEdgesRequest req;
    while (stream_.Read(&req)) {
      auto converted = edge_wire::to_part(req);
      req.Clear();
      if (!converted) {
        edge_log::log_err("ignoring request with no part set");
        continue;
      }
      part = std::move(*converted);
      return true;
    }

    // Read() also returns false when the call is torn down.
    if (ctx_.IsCancelled()) {
      throw TransportError("call cancelled while receiving", true);
    }
    return false;
  }

private:
  grpc::ServerContext &ctx_;
  Stream &stream_;
};

class GrpcChunkSink : public edge_stream::ChunkSink {
public:
  GrpcChunkSink(grpc::ServerContext &ctx, Stream &stream)
      : ctx_(ctx), stream_(stream) {}

  // Write() blocks until flow control lets the message out.
  void send(const edge_stream::OutputChunk &chunk) override {
    DetectEdgesResponse resp;
    edge_wire::fill_response(chunk, resp);
    if (!stream_.Write(resp)) {
      throw TransportError("failed to write response chunk",
                           ctx_.IsCancelled());
    }
  }

  bool cancelled() const override { return ctx_.IsCancelled(); }

private:
  grpc::ServerContext &ctx_;
  Stream &stream_;
};

std::string session_tag(uint64_t id) { return "session " + std::to_string(id); }

} // namespace

grpc::Status to_grpc_status(const SessionOutcome &outcome) {
  if (outcome.ok()) {
    return grpc::Status::OK;
  }
  switch (outcome.error) {
  case ErrorKind::InvalidRequest:
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, outcome.message);
  case ErrorKind::Processing:
    return grpc::Status(grpc::StatusCode::INTERNAL, outcome.message);
  case ErrorKind::Transport:
    return grpc::Status(outcome.cancelled ? grpc::StatusCode::CANCELLED
                                          : grpc::StatusCode::UNAVAILABLE,
                        outcome.message);
  case ErrorKind::None:
    break;
  }
  return grpc::Status(grpc::StatusCode::INTERNAL, "session ended in state " +
                                                      std::string(to_string(
                                                          outcome.state)));
}

DetectEdgesService::DetectEdgesService(edge_stream::SessionLimiter &limiter,
                                       TransformFactory transform_factory,
                                       ServiceOptions options)
    : limiter_(limiter), transform_factory_(std::move(transform_factory)),
      options_(options) {}

grpc::Status DetectEdgesService::DetectEdges(grpc::ServerContext *context,
                                             Stream *stream) {
  const uint64_t id = next_session_id_.fetch_add(1);
  const std::string tag = session_tag(id);

  auto permit = limiter_.acquire(options_.admission_timeout);
  if (!permit) {
    edge_log::log_err(tag + ": rejected, " +
                      std::to_string(limiter_.capacity()) +
                      " sessions already in flight");
    return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED,
                        "server busy: too many concurrent sessions");
  }

  edge_log::log_err(tag + ": started (peer " + context->peer() + ")");

  std::unique_ptr<edge_transform::ImageTransform> transform =
      transform_factory_();
  if (!transform) {
    edge_log::log_err(tag + ": no transform available");
    return grpc::Status(grpc::StatusCode::INTERNAL,
                        "image processing unavailable");
  }

  GrpcPartSource source(*context, *stream);
  GrpcChunkSink sink(*context, *stream);
  edge_stream::StreamSession session(source, sink, *transform,
                                     options_.chunk_size);
  const SessionOutcome outcome = session.run();

  if (outcome.parameter_replacements > 0) {
    edge_log::log_err(tag + ": parameters sent " +
                      std::to_string(outcome.parameter_replacements + 1) +
                      " times; last value used");
  }

  if (outcome.ok()) {
    edge_log::log_err(tag + ": done (in=" +
                      std::to_string(outcome.payload_bytes) + " bytes/" +
                      std::to_string(outcome.data_chunks) + " chunks, out=" +
                      std::to_string(outcome.chunks_sent) + " chunks)");
  } else {
    edge_log::log_err(tag + ": failed [" + to_string(outcome.error) +
                      "]: " + outcome.message);
  }

  return to_grpc_status(outcome);
}

} // namespace edge_rpc
