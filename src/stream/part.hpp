#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace edge_stream {

using Bytes = std::vector<uint8_t>;

// Reference chunk size policy for outbound fragments.
constexpr size_t kDefaultChunkSize = 2048;

// Opaque fragment of the input payload. Carries no offset; stream order is
// the only assembly order.
struct DataChunk {
  Bytes content;
};

// Transform tuning parameters (last seen wins).
struct ControlParameters {
  int32_t min_threshold = 0;
  int32_t max_threshold = 0;
};

inline bool operator==(const ControlParameters &a, const ControlParameters &b) {
  return a.min_threshold == b.min_threshold &&
         a.max_threshold == b.max_threshold;
}

inline bool operator!=(const ControlParameters &a, const ControlParameters &b) {
  return !(a == b);
}

// One inbound message.
using Part = std::variant<DataChunk, ControlParameters>;

struct AssembledRequest {
  Bytes payload;
  std::optional<ControlParameters> params;
};

struct OutputChunk {
  Bytes content;
};

} // namespace edge_stream
