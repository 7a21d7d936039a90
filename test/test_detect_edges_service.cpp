#include "catch2/catch.hpp"

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>
#include <vector>

#include "client/edge_client.hpp"
#include "rpc/detect_edges_service.hpp"
#include "rpc/wire_adapter.hpp"
#include "test_helpers.hpp"
#include "test_images.hpp"
#include "transform/canny_edge_transform.hpp"

using namespace test_helpers;
using canny_edge::v1::CannyEdgeDetector;
using canny_edge::v1::DetectEdgesResponse;
using edge_rpc::DetectEdgesService;
using edge_rpc::ServiceOptions;
using edge_rpc::TransformFactory;

namespace {

// Service on an in-process channel; no sockets involved.
struct InProcessServer {
  InProcessServer(size_t capacity, TransformFactory factory,
                  ServiceOptions options)
      : limiter(capacity), service(limiter, std::move(factory), options) {
    grpc::ServerBuilder builder;
    builder.RegisterService(&service);
    server = builder.BuildAndStart();
    channel = server->InProcessChannel(grpc::ChannelArguments());
    stub = CannyEdgeDetector::NewStub(channel);
  }

  ~InProcessServer() { server->Shutdown(); }

  edge_stream::SessionLimiter limiter;
  DetectEdgesService service;
  std::unique_ptr<grpc::Server> server;
  std::shared_ptr<grpc::Channel> channel;
  std::unique_ptr<CannyEdgeDetector::Stub> stub;
};

struct CallResult {
  grpc::Status status;
  std::vector<std::string> chunks;
};

CallResult call(CannyEdgeDetector::Stub &stub, const std::vector<Part> &parts) {
  grpc::ClientContext ctx;
  auto stream = stub.DetectEdges(&ctx);
  for (const auto &p : parts) {
    if (!stream->Write(edge_wire::make_request(p))) {
      break;
    }
  }
  stream->WritesDone();

  CallResult result;
  DetectEdgesResponse resp;
  while (stream->Read(&resp)) {
    result.chunks.push_back(resp.image_chunk());
  }
  result.status = stream->Finish();
  return result;
}

TransformFactory identity() {
  return [] { return std::make_unique<IdentityTransform>(); };
}

ServiceOptions with_chunk_size(size_t n) {
  ServiceOptions options;
  options.chunk_size = n;
  return options;
}

} // namespace

TEST_CASE("gRPC: chunks are reassembled and re-emitted") {
  InProcessServer srv(2, identity(), with_chunk_size(3));

  const auto result =
      call(*srv.stub, {data("AAAA"), params(50, 150), data("BBBB")});

  REQUIRE(result.status.ok());
  REQUIRE(result.chunks == std::vector<std::string>{"AAA", "ABB", "BB"});
  REQUIRE(srv.service.sessions_started() == 1);
}

TEST_CASE("gRPC: missing parameters is INVALID_ARGUMENT") {
  InProcessServer srv(2, identity(), with_chunk_size(3));

  const auto result = call(*srv.stub, {data("AAAA"), data("BBBB")});

  REQUIRE(result.status.error_code() == grpc::StatusCode::INVALID_ARGUMENT);
  REQUIRE(result.status.error_message() ==
          "missing image processing parameters");
  REQUIRE(result.chunks.empty());
}

TEST_CASE("gRPC: transform failure is INTERNAL without output") {
  InProcessServer srv(2, [] { return std::make_unique<FailingTransform>(); },
                      with_chunk_size(3));

  const auto result = call(*srv.stub, {params(1, 2), data("garbage")});

  REQUIRE(result.status.error_code() == grpc::StatusCode::INTERNAL);
  REQUIRE(result.status.error_message().find("not an image") !=
          std::string::npos);
  REQUIRE(result.chunks.empty());
}

TEST_CASE("gRPC: full server answers RESOURCE_EXHAUSTED") {
  ServiceOptions options;
  options.admission_timeout = std::chrono::milliseconds(0);
  InProcessServer srv(1, identity(), options);

  auto held = srv.limiter.try_acquire();
  REQUIRE(held);

  const auto result = call(*srv.stub, {params(1, 2), data("abc")});
  REQUIRE(result.status.error_code() == grpc::StatusCode::RESOURCE_EXHAUSTED);
  REQUIRE(result.chunks.empty());

  held.reset();
  REQUIRE(call(*srv.stub, {params(1, 2), data("abc")}).status.ok());
}

TEST_CASE("gRPC: client round trip through the edge detector") {
  InProcessServer srv(
      2, [] { return std::make_unique<edge_transform::CannyEdgeTransform>(); },
      with_chunk_size(2048));

  const Bytes input =
      test_images::encode(test_images::horizontal_step(100, 80, 40));

  edge_client::CannyEdgeClient client(srv.channel);
  edge_client::DetectOptions options;
  options.chunk_size = 1000;
  const Bytes output = client.detect_edges(input, options);

  REQUIRE(client.last_request_chunks() == (input.size() + 999) / 1000);
  REQUIRE(client.last_response_chunks() == (output.size() + 2047) / 2048);
  REQUIRE(output ==
          edge_transform::encode_jpeg(edge_transform::detect_edges(
              edge_transform::decode_image(input), 100, 200)));
}

TEST_CASE("gRPC: client surfaces the server error") {
  InProcessServer srv(2, identity(), with_chunk_size(16));

  edge_client::CannyEdgeClient client(srv.channel);
  edge_client::DetectOptions options;
  options.chunk_size = 4;
  // Identity echoes the input, so this succeeds...
  REQUIRE(str(client.detect_edges(bytes("0123456789"), options)) ==
          "0123456789");

  InProcessServer failing(
      2, [] { return std::make_unique<FailingTransform>(); },
      with_chunk_size(16));
  edge_client::CannyEdgeClient failing_client(failing.channel);
  // ...and this one reports the status.
  REQUIRE_THROWS_WITH(failing_client.detect_edges(bytes("x"), options),
                      Catch::Contains("code=13"));
}

TEST_CASE("outcome to gRPC status") {
  edge_stream::SessionOutcome outcome;
  outcome.state = edge_stream::SessionState::Done;
  REQUIRE(edge_rpc::to_grpc_status(outcome).ok());

  outcome.state = edge_stream::SessionState::Failed;
  outcome.error = edge_stream::ErrorKind::Transport;
  outcome.cancelled = true;
  REQUIRE(edge_rpc::to_grpc_status(outcome).error_code() ==
          grpc::StatusCode::CANCELLED);

  outcome.cancelled = false;
  REQUIRE(edge_rpc::to_grpc_status(outcome).error_code() ==
          grpc::StatusCode::UNAVAILABLE);
}
