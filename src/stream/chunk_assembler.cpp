#include "stream/chunk_assembler.hpp"

#include <utility>

#include "stream/errors.hpp"

namespace edge_stream {

void ChunkAssembler::observe(const Part &part) {
  if (const auto *chunk = std::get_if<DataChunk>(&part)) {
    append(chunk->content);
  } else if (const auto *params = std::get_if<ControlParameters>(&part)) {
    set_params(*params);
  }
}

void ChunkAssembler::observe(Part &&part) {
  if (auto *chunk = std::get_if<DataChunk>(&part)) {
    if (payload_.empty()) {
      // First fragment: adopt its buffer instead of copying.
      payload_ = std::move(chunk->content);
      ++data_chunks_;
      return;
    }
    append(chunk->content);
  } else if (const auto *params = std::get_if<ControlParameters>(&part)) {
    set_params(*params);
  }
}

void ChunkAssembler::append(const Bytes &content) {
  payload_.insert(payload_.end(), content.begin(), content.end());
  ++data_chunks_;
}

void ChunkAssembler::set_params(const ControlParameters &params) {
  if (params_) {
    ++replacements_;
  }
  params_ = params;
}

AssembledRequest ChunkAssembler::finalize() {
  if (!params_) {
    throw MissingParametersError();
  }

  AssembledRequest req;
  req.payload = std::move(payload_);
  req.params = params_;
  reset();
  return req;
}

void ChunkAssembler::reset() {
  Bytes().swap(payload_);
  params_.reset();
  data_chunks_ = 0;
  replacements_ = 0;
}

} // namespace edge_stream
