#pragma once

#include <cstddef>
#include <istream>
#include <ostream>

#include "stream/stream_io.hpp"
#include "stream/stream_session.hpp"
#include "transform/image_transform.hpp"

namespace edge_wire {

// DetectEdgesRequest frames from a byte stream. EOF on a frame boundary is
// end-of-input; every other read problem is a TransportError.
class FramedPartSource : public edge_stream::PartSource {
public:
  explicit FramedPartSource(std::istream &in) : in_(in) {}

  bool next(edge_stream::Part &part) override;

  size_t frames_read() const { return frames_read_; }
  size_t empty_requests() const { return empty_requests_; }

private:
  std::istream &in_;
  size_t frames_read_ = 0;
  size_t empty_requests_ = 0;
};

// ServerFrame{response} frames to a byte stream.
class FramedChunkSink : public edge_stream::ChunkSink {
public:
  explicit FramedChunkSink(std::ostream &out) : out_(out) {}

  void send(const edge_stream::OutputChunk &chunk) override;

private:
  std::ostream &out_;
};

/**
 * @brief Run one session over framed streams and write the status trailer.
 *
 * Output: zero or more ServerFrame{response} frames followed by exactly one
 * ServerFrame{status}. The trailer is skipped only when the output stream
 * itself has failed.
 */
edge_stream::SessionOutcome
run_framed_session(std::istream &in, std::ostream &out,
                   edge_transform::ImageTransform &transform,
                   size_t chunk_size);

} // namespace edge_wire
