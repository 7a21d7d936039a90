#include "catch2/catch.hpp"

#include "rpc/wire_adapter.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;
using edge_stream::ErrorKind;
using edge_stream::SessionOutcome;
using edge_stream::SessionState;
using edge_wire::DetectEdgesRequest;
using edge_wire::SessionStatus;

TEST_CASE("image chunk request becomes a data part") {
  DetectEdgesRequest req;
  req.mutable_image_chunk()->set_content(std::string("\x00\x01\x02", 3));

  auto part = edge_wire::to_part(req);
  REQUIRE(part);
  const auto *chunk = std::get_if<DataChunk>(&*part);
  REQUIRE(chunk != nullptr);
  REQUIRE(chunk->content == Bytes{0, 1, 2});
}

TEST_CASE("parameters request becomes a control part") {
  const DetectEdgesRequest req = edge_wire::make_parameters_request(-5, 70000);

  auto part = edge_wire::to_part(req);
  REQUIRE(part);
  const auto *p = std::get_if<ControlParameters>(&*part);
  REQUIRE(p != nullptr);
  REQUIRE(p->min_threshold == -5);
  REQUIRE(p->max_threshold == 70000);
}

TEST_CASE("request with nothing set carries no part") {
  DetectEdgesRequest req;
  REQUIRE_FALSE(edge_wire::to_part(req));
}

TEST_CASE("make_request covers both variants") {
  REQUIRE(edge_wire::make_request(data("abc")).image_chunk().content() ==
          "abc");
  REQUIRE(edge_wire::make_request(params(1, 2)).parameters().maxthreshold() ==
          2);
}

TEST_CASE("status codes follow the error category") {
  SessionOutcome outcome;
  outcome.state = SessionState::Done;
  REQUIRE(edge_wire::status_code_for(outcome) == SessionStatus::CODE_OK);
  REQUIRE(edge_wire::make_status(outcome).message() == "ok");

  outcome.state = SessionState::Failed;
  outcome.error = ErrorKind::InvalidRequest;
  outcome.message = "missing image processing parameters";
  REQUIRE(edge_wire::status_code_for(outcome) ==
          SessionStatus::CODE_INVALID_ARGUMENT);
  REQUIRE(edge_wire::make_status(outcome).message() == outcome.message);

  outcome.error = ErrorKind::Processing;
  REQUIRE(edge_wire::status_code_for(outcome) == SessionStatus::CODE_INTERNAL);

  outcome.error = ErrorKind::Transport;
  REQUIRE(edge_wire::status_code_for(outcome) ==
          SessionStatus::CODE_UNAVAILABLE);

  outcome.cancelled = true;
  REQUIRE(edge_wire::status_code_for(outcome) == SessionStatus::CODE_CANCELLED);
}
