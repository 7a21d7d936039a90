#pragma once

#include "stream/part.hpp"

namespace edge_stream {

// Inbound side of one session. The only suspension point on input.
class PartSource {
public:
  virtual ~PartSource() = default;

  // Blocks until the next part arrives. Returns false on graceful
  // end-of-input. Throws TransportError on failure or cancellation.
  virtual bool next(Part &part) = 0;
};

// Outbound side of one session.
class ChunkSink {
public:
  virtual ~ChunkSink() = default;

  // Blocks until the transport accepts the chunk (backpressure).
  // Throws TransportError if the chunk cannot be delivered.
  virtual void send(const OutputChunk &chunk) = 0;

  // Peer went away or the call was cancelled.
  virtual bool cancelled() const { return false; }
};

} // namespace edge_stream
