#pragma once

#include <optional>
#include <string>

#include "canny_edge.pb.h"
#include "stream/part.hpp"
#include "stream/stream_session.hpp"

namespace edge_wire {

using canny_edge::v1::DetectEdgesRequest;
using canny_edge::v1::DetectEdgesResponse;
using canny_edge::v1::SessionStatus;

// Request -> Part. Returns nullopt when no oneof member is set.
std::optional<edge_stream::Part> to_part(const DetectEdgesRequest &req);

// Part -> request (client side).
DetectEdgesRequest make_request(const edge_stream::Part &part);
DetectEdgesRequest make_parameters_request(int32_t min_threshold,
                                           int32_t max_threshold);
DetectEdgesRequest make_chunk_request(const edge_stream::OutputChunk &chunk);

void fill_response(const edge_stream::OutputChunk &chunk,
                   DetectEdgesResponse &resp);

// Terminal status for a finished session.
SessionStatus::Code status_code_for(const edge_stream::SessionOutcome &outcome);
SessionStatus make_status(const edge_stream::SessionOutcome &outcome);
SessionStatus make_status(SessionStatus::Code code, const std::string &msg);

} // namespace edge_wire
