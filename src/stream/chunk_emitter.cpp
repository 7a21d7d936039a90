#include "stream/chunk_emitter.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace edge_stream {

ChunkEmitter::ChunkEmitter(Bytes payload, size_t max_chunk_size)
    : payload_(std::move(payload)), max_chunk_size_(max_chunk_size) {
  if (max_chunk_size_ == 0) {
    throw std::invalid_argument("chunk size must be > 0");
  }
}

bool ChunkEmitter::next(OutputChunk &out) {
  if (exhausted()) {
    return false;
  }

  const size_t len = std::min(max_chunk_size_, payload_.size() - offset_);
  const auto first = payload_.begin() + static_cast<std::ptrdiff_t>(offset_);
  out.content.assign(first, first + static_cast<std::ptrdiff_t>(len));
  offset_ += len;
  ++emitted_;
  return true;
}

size_t ChunkEmitter::chunk_count() const {
  return (payload_.size() + max_chunk_size_ - 1) / max_chunk_size_;
}

} // namespace edge_stream
