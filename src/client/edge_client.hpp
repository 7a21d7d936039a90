#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "canny_edge.grpc.pb.h"

namespace edge_client {

struct DetectOptions {
  int32_t min_threshold = 100;
  int32_t max_threshold = 200;
  size_t chunk_size = 2048;
  std::chrono::milliseconds timeout{60000};
};

// Blocking client for CannyEdgeDetector.DetectEdges.
class CannyEdgeClient {
public:
  // Throws std::runtime_error if the server is not reachable within
  // connect_timeout.
  explicit CannyEdgeClient(
      const std::string &server_address,
      std::chrono::milliseconds connect_timeout = std::chrono::seconds(5));

  // For tests: use an existing channel (e.g. in-process) without waiting.
  explicit CannyEdgeClient(std::shared_ptr<grpc::Channel> channel);

  // Sends the parameters first, then the image in chunk_size pieces, and
  // returns the concatenated response chunks.
  // Throws std::runtime_error with the RPC status on failure.
  std::vector<uint8_t> detect_edges(const std::vector<uint8_t> &image,
                                    const DetectOptions &options);

  size_t last_request_chunks() const { return last_request_chunks_; }
  size_t last_response_chunks() const { return last_response_chunks_; }

private:
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<canny_edge::v1::CannyEdgeDetector::Stub> stub_;

  size_t last_request_chunks_ = 0;
  size_t last_response_chunks_ = 0;
};

} // namespace edge_client
