#include "stream/stream_session.hpp"

#include <exception>
#include <string>
#include <utility>

#include "stream/chunk_emitter.hpp"
#include "stream/errors.hpp"

namespace edge_stream {

const char *to_string(SessionState state) {
  switch (state) {
  case SessionState::Receiving:
    return "receiving";
  case SessionState::Processing:
    return "processing";
  case SessionState::Emitting:
    return "emitting";
  case SessionState::Done:
    return "done";
  case SessionState::Failed:
    return "failed";
  }
  return "unknown";
}

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Transport:
    return "transport";
  case ErrorKind::InvalidRequest:
    return "invalid_request";
  case ErrorKind::Processing:
    return "processing";
  }
  return "unknown";
}

StreamSession::StreamSession(PartSource &source, ChunkSink &sink,
                             edge_transform::ImageTransform &transform,
                             size_t max_chunk_size)
    : source_(source), sink_(sink), transform_(transform),
      max_chunk_size_(max_chunk_size == 0 ? kDefaultChunkSize
                                          : max_chunk_size) {}

SessionOutcome StreamSession::run() {
  if (ran_) {
    return outcome_;
  }
  ran_ = true;

  try {
    receive();

    state_ = SessionState::Processing;
    AssembledRequest req = assembler_.finalize();

    Bytes output = process(req);
    // The request is no longer needed once the transform has run.
    Bytes().swap(req.payload);

    state_ = SessionState::Emitting;
    emit(std::move(output));

    state_ = SessionState::Done;
    outcome_.state = state_;
  } catch (const TransportError &e) {
    fail(ErrorKind::Transport, e.what(), e.cancelled());
  } catch (const InvalidRequestError &e) {
    fail(ErrorKind::InvalidRequest, e.what());
  } catch (const ProcessingError &e) {
    fail(ErrorKind::Processing, e.what());
  } catch (const std::exception &e) {
    // Anything else (e.g. bad_alloc while buffering) is a server-side fault.
    fail(ErrorKind::Processing, std::string("internal error: ") + e.what());
  }

  return outcome_;
}

void StreamSession::receive() {
  state_ = SessionState::Receiving;

  Part part;
  while (source_.next(part)) {
    assembler_.observe(std::move(part));
    part = Part{};
  }
  outcome_.payload_bytes = assembler_.buffered_bytes();
  outcome_.data_chunks = assembler_.data_chunks_observed();
  outcome_.parameter_replacements = assembler_.parameter_replacements();
}

Bytes StreamSession::process(const AssembledRequest &req) {
  if (sink_.cancelled()) {
    throw TransportError("call cancelled before processing", true);
  }

  try {
    return transform_.apply(req.payload, req.params->min_threshold,
                            req.params->max_threshold);
  } catch (const std::exception &e) {
    throw ProcessingError(e.what());
  } catch (...) {
    throw ProcessingError("unknown transform failure");
  }
}

void StreamSession::emit(Bytes output) {
  ChunkEmitter emitter(std::move(output), max_chunk_size_);

  OutputChunk chunk;
  while (emitter.next(chunk)) {
    if (sink_.cancelled()) {
      throw TransportError("call cancelled during emission", true);
    }
    sink_.send(chunk);
    ++outcome_.chunks_sent;
  }
}

void StreamSession::fail(ErrorKind kind, const std::string &message,
                         bool cancelled) {
  assembler_.reset();
  state_ = SessionState::Failed;
  outcome_.state = state_;
  outcome_.error = kind;
  outcome_.cancelled = cancelled;
  outcome_.message = message;
}

} // namespace edge_stream
