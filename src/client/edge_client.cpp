#include "client/edge_client.hpp"

#include <stdexcept>
#include <utility>

#include "rpc/wire_adapter.hpp"
#include "stream/chunk_emitter.hpp"

namespace edge_client {

using canny_edge::v1::DetectEdgesRequest;
using canny_edge::v1::DetectEdgesResponse;

CannyEdgeClient::CannyEdgeClient(const std::string &server_address,
                                 std::chrono::milliseconds connect_timeout) {
  channel_ =
      grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials());
  stub_ = canny_edge::v1::CannyEdgeDetector::NewStub(channel_);

  const auto deadline = std::chrono::system_clock::now() + connect_timeout;
  if (!channel_->WaitForConnected(deadline)) {
    throw std::runtime_error("Failed to connect to canny-edge-server at " +
                             server_address);
  }
}

CannyEdgeClient::CannyEdgeClient(std::shared_ptr<grpc::Channel> channel)
    : channel_(std::move(channel)),
      stub_(canny_edge::v1::CannyEdgeDetector::NewStub(channel_)) {}

std::vector<uint8_t>
CannyEdgeClient::detect_edges(const std::vector<uint8_t> &image,
                              const DetectOptions &options) {
  last_request_chunks_ = 0;
  last_response_chunks_ = 0;

  grpc::ClientContext ctx;
  if (options.timeout.count() > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + options.timeout);
  }

  auto stream = stub_->DetectEdges(&ctx);

  // The server replies only after the request stream is closed, so writing
  // everything before reading cannot deadlock.
  bool write_ok = stream->Write(edge_wire::make_parameters_request(
      options.min_threshold, options.max_threshold));

  edge_stream::ChunkEmitter emitter(image, options.chunk_size);
  edge_stream::OutputChunk chunk;
  while (write_ok && emitter.next(chunk)) {
    write_ok = stream->Write(edge_wire::make_chunk_request(chunk));
    if (write_ok) {
      ++last_request_chunks_;
    }
  }
  // A failed write means the call is already over; Finish() has the reason.
  stream->WritesDone();

  std::vector<uint8_t> result;
  DetectEdgesResponse resp;
  while (stream->Read(&resp)) {
    const std::string &piece = resp.image_chunk();
    result.insert(result.end(), piece.begin(), piece.end());
    ++last_response_chunks_;
  }

  const grpc::Status status = stream->Finish();
  if (!status.ok()) {
    throw std::runtime_error(
        "DetectEdges RPC failed: code=" +
        std::to_string(static_cast<int>(status.error_code())) +
        " message=" + status.error_message());
  }
  return result;
}

} // namespace edge_client
