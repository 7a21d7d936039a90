#include "rpc/stdio_session.hpp"

#include <string>
#include <utility>
#include <vector>

#include "core/log.hpp"
#include "core/transport/framed_stdio.hpp"
#include "rpc/wire_adapter.hpp"
#include "stream/errors.hpp"

namespace edge_wire {

using canny_edge::v1::ServerFrame;
using edge_stream::TransportError;

bool FramedPartSource::next(edge_stream::Part &part) {
  std::vector<uint8_t> frame;
  std::string io_err;

  while (true) {
    const auto status = transport::read_frame(in_, frame, io_err);
    if (status == transport::ReadStatus::EndOfInput) {
      return false;
    }
    if (status == transport::ReadStatus::Error) {
      throw TransportError("read_frame error: " + io_err);
    }
    ++frames_read_;

    DetectEdgesRequest req;
    if (!req.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
      throw edge_stream::InvalidRequestError(
          "malformed request frame: not a DetectEdgesRequest");
    }

    auto converted = to_part(req);
    if (!converted) {
      ++empty_requests_;
      edge_log::log_err("ignoring request with no part set");
      continue;
    }
    part = std::move(*converted);
    return true;
  }
}

static void write_server_frame(std::ostream &out, const ServerFrame &frame) {
  std::string bytes;
  if (!frame.SerializeToString(&bytes)) {
    throw TransportError("failed to serialize ServerFrame protobuf");
  }

  std::string io_err;
  if (!transport::write_frame(out, bytes, io_err)) {
    throw TransportError("write_frame error: " + io_err);
  }
}

void FramedChunkSink::send(const edge_stream::OutputChunk &chunk) {
  ServerFrame frame;
  fill_response(chunk, *frame.mutable_response());
  write_server_frame(out_, frame);
}

edge_stream::SessionOutcome
run_framed_session(std::istream &in, std::ostream &out,
                   edge_transform::ImageTransform &transform,
                   size_t chunk_size) {
  FramedPartSource source(in);
  FramedChunkSink sink(out);
  edge_stream::StreamSession session(source, sink, transform, chunk_size);

  edge_stream::SessionOutcome outcome = session.run();

  if (!out.good()) {
    edge_log::log_err("output stream failed; status trailer not written");
    return outcome;
  }

  ServerFrame trailer;
  *trailer.mutable_status() = make_status(outcome);
  try {
    write_server_frame(out, trailer);
  } catch (const TransportError &e) {
    edge_log::log_err(std::string("failed to write status trailer: ") +
                      e.what());
    // The peer cannot tell success from failure without the trailer.
    outcome.state = edge_stream::SessionState::Failed;
    outcome.error = edge_stream::ErrorKind::Transport;
    outcome.message = e.what();
  }
  return outcome;
}

} // namespace edge_wire
