#pragma once

#include <cstddef>
#include <optional>

#include "stream/part.hpp"

namespace edge_stream {

/**
 * @brief Reassembles an inbound Part stream into one AssembledRequest.
 *
 * Data chunks are appended in the order observed. Control parameters may
 * arrive anywhere in the stream; a later set replaces an earlier one.
 * No size cap is enforced here.
 *
 * Completion is driven by the caller: finalize() is called once the inbound
 * stream reports end-of-input, never because is_ready() became true.
 */
class ChunkAssembler {
public:
  ChunkAssembler() = default;

  ChunkAssembler(const ChunkAssembler &) = delete;
  ChunkAssembler &operator=(const ChunkAssembler &) = delete;

  void observe(const Part &part);
  void observe(Part &&part);

  // True once ControlParameters has been observed at least once.
  bool is_ready() const { return params_.has_value(); }

  /**
   * @brief Produce the request from everything observed so far.
   *
   * Moves the payload out; the assembler is empty afterwards.
   *
   * @throws MissingParametersError if no ControlParameters was observed
   */
  AssembledRequest finalize();

  // Drop buffered data and parameters (cancelled or failed session).
  void reset();

  size_t buffered_bytes() const { return payload_.size(); }
  size_t data_chunks_observed() const { return data_chunks_; }
  // Number of ControlParameters parts that replaced an earlier one.
  size_t parameter_replacements() const { return replacements_; }

private:
  void append(const Bytes &content);
  void set_params(const ControlParameters &params);

  Bytes payload_;
  std::optional<ControlParameters> params_;
  size_t data_chunks_ = 0;
  size_t replacements_ = 0;
};

} // namespace edge_stream
