#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace edge_transform {

// Any failure of a transform implementation.
class TransformError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Payload is not a supported image encoding.
class InvalidImageError : public TransformError {
public:
  explicit InvalidImageError(const std::string &detail)
      : TransformError("Invalid image data provided: " + detail) {}
};

// Payload + thresholds -> output payload. Thresholds are passed through
// uninterpreted; range checks, if any, belong to the implementation.
class ImageTransform {
public:
  virtual ~ImageTransform() = default;

  virtual std::vector<uint8_t> apply(const std::vector<uint8_t> &payload,
                                     int32_t min_threshold,
                                     int32_t max_threshold) = 0;

  virtual std::string name() const = 0;
};

} // namespace edge_transform
