#include "rpc/wire_adapter.hpp"

namespace edge_wire {

using edge_stream::ControlParameters;
using edge_stream::DataChunk;
using edge_stream::ErrorKind;
using edge_stream::OutputChunk;
using edge_stream::Part;
using edge_stream::SessionOutcome;

static ControlParameters
to_control_parameters(const canny_edge::v1::Parameters &params) {
  ControlParameters out;
  out.min_threshold = params.minthreshold();
  out.max_threshold = params.maxthreshold();
  return out;
}

std::optional<Part> to_part(const DetectEdgesRequest &req) {
  switch (req.part_case()) {
  case DetectEdgesRequest::kImageChunk: {
    const std::string &content = req.image_chunk().content();
    return Part{DataChunk{edge_stream::Bytes(content.begin(), content.end())}};
  }
  case DetectEdgesRequest::kParameters:
    return Part{to_control_parameters(req.parameters())};
  case DetectEdgesRequest::PART_NOT_SET:
    break;
  }
  return std::nullopt;
}

DetectEdgesRequest make_parameters_request(int32_t min_threshold,
                                           int32_t max_threshold) {
  DetectEdgesRequest req;
  auto *params = req.mutable_parameters();
  params->set_minthreshold(min_threshold);
  params->set_maxthreshold(max_threshold);
  return req;
}

DetectEdgesRequest make_chunk_request(const OutputChunk &chunk) {
  DetectEdgesRequest req;
  req.mutable_image_chunk()->set_content(chunk.content.data(),
                                         chunk.content.size());
  return req;
}

DetectEdgesRequest make_request(const Part &part) {
  if (const auto *params = std::get_if<ControlParameters>(&part)) {
    return make_parameters_request(params->min_threshold,
                                   params->max_threshold);
  }
  const auto &chunk = std::get<DataChunk>(part);
  DetectEdgesRequest req;
  req.mutable_image_chunk()->set_content(chunk.content.data(),
                                         chunk.content.size());
  return req;
}

void fill_response(const OutputChunk &chunk, DetectEdgesResponse &resp) {
  resp.set_image_chunk(chunk.content.data(), chunk.content.size());
}

SessionStatus::Code status_code_for(const SessionOutcome &outcome) {
  if (outcome.ok()) {
    return SessionStatus::CODE_OK;
  }
  switch (outcome.error) {
  case ErrorKind::InvalidRequest:
    return SessionStatus::CODE_INVALID_ARGUMENT;
  case ErrorKind::Processing:
    return SessionStatus::CODE_INTERNAL;
  case ErrorKind::Transport:
    return outcome.cancelled ? SessionStatus::CODE_CANCELLED
                             : SessionStatus::CODE_UNAVAILABLE;
  case ErrorKind::None:
    break;
  }
  return SessionStatus::CODE_INTERNAL;
}

SessionStatus make_status(SessionStatus::Code code, const std::string &msg) {
  SessionStatus status;
  status.set_code(code);
  status.set_message(msg);
  return status;
}

SessionStatus make_status(const SessionOutcome &outcome) {
  return make_status(status_code_for(outcome),
                     outcome.ok() ? "ok" : outcome.message);
}

} // namespace edge_wire
