#pragma once

#include <cstddef>

#include "stream/part.hpp"

namespace edge_stream {

// Splits one output payload into consecutive slices of at most
// max_chunk_size bytes, produced one at a time. An empty payload yields no
// chunks. To start over, construct a new emitter over the same payload.
class ChunkEmitter {
public:
  // Throws std::invalid_argument if max_chunk_size is 0.
  explicit ChunkEmitter(Bytes payload,
                        size_t max_chunk_size = kDefaultChunkSize);

  // Writes the next slice into out. Returns false once exhausted.
  bool next(OutputChunk &out);

  bool exhausted() const { return offset_ >= payload_.size(); }

  // ceil(payload size / max chunk size)
  size_t chunk_count() const;
  size_t chunks_emitted() const { return emitted_; }
  size_t payload_size() const { return payload_.size(); }
  size_t max_chunk_size() const { return max_chunk_size_; }

private:
  Bytes payload_;
  size_t max_chunk_size_;
  size_t offset_ = 0;
  size_t emitted_ = 0;
};

} // namespace edge_stream
