#pragma once

#include <cstddef>
#include <string>

#include "stream/chunk_assembler.hpp"
#include "stream/stream_io.hpp"
#include "transform/image_transform.hpp"

namespace edge_stream {

enum class SessionState { Receiving, Processing, Emitting, Done, Failed };

enum class ErrorKind {
  None,
  Transport,      // inbound/outbound failure or cancellation
  InvalidRequest, // malformed part or end-of-input without parameters
  Processing      // transform failed, or an internal server fault
};

struct SessionOutcome {
  SessionState state = SessionState::Receiving;
  ErrorKind error = ErrorKind::None;
  bool cancelled = false; // Transport only
  std::string message;
  size_t payload_bytes = 0;
  size_t data_chunks = 0;
  size_t parameter_replacements = 0; // ControlParameters seen more than once
  size_t chunks_sent = 0;

  bool ok() const { return state == SessionState::Done; }
};

const char *to_string(SessionState state);
const char *to_string(ErrorKind kind);

/**
 * @brief One request/response exchange over one bidirectional stream.
 *
 * Runs strictly sequentially:
 *   Receiving -> Processing -> Emitting -> Done
 * with Failed reachable from every non-terminal state.
 *
 * Output chunks are only sent after the transform has fully succeeded, so a
 * failure before Emitting never produces partial output. A failure during
 * Emitting stops emission immediately.
 *
 * run() reports every protocol failure through the returned outcome.
 */
class StreamSession {
public:
  StreamSession(PartSource &source, ChunkSink &sink,
                edge_transform::ImageTransform &transform,
                size_t max_chunk_size = kDefaultChunkSize);

  StreamSession(const StreamSession &) = delete;
  StreamSession &operator=(const StreamSession &) = delete;

  // Drive the session to Done or Failed. Call once.
  SessionOutcome run();

  SessionState state() const { return state_; }
  const ChunkAssembler &assembler() const { return assembler_; }

private:
  void receive();
  Bytes process(const AssembledRequest &req);
  void emit(Bytes output);
  void fail(ErrorKind kind, const std::string &message, bool cancelled = false);

  PartSource &source_;
  ChunkSink &sink_;
  edge_transform::ImageTransform &transform_;
  size_t max_chunk_size_;

  ChunkAssembler assembler_;
  SessionState state_ = SessionState::Receiving;
  SessionOutcome outcome_;
  bool ran_ = false;
};

} // namespace edge_stream
