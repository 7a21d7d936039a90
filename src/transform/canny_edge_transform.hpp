#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "transform/image_transform.hpp"

namespace edge_transform {

/**
 * @brief Canny edge detector backed by OpenCV.
 *
 * Input: any encoding cv::imdecode understands (JPEG, PNG, BMP, ...),
 * loaded as 8-bit BGR. Output: the single-channel edge map encoded as JPEG.
 *
 * Thresholds go to cv::Canny unchanged (aperture 3, L1 gradient); OpenCV
 * swaps them when given in reverse order.
 */
class CannyEdgeTransform : public ImageTransform {
public:
  std::vector<uint8_t> apply(const std::vector<uint8_t> &payload,
                             int32_t min_threshold,
                             int32_t max_threshold) override;

  std::string name() const override { return "canny"; }
};

// Encoded bytes -> 8-bit BGR image. Throws InvalidImageError.
cv::Mat decode_image(const std::vector<uint8_t> &payload);

// Edge map (CV_8UC1, 0 or 255) of a decoded image.
cv::Mat detect_edges(const cv::Mat &image, int32_t threshold1,
                     int32_t threshold2);

// Throws TransformError when OpenCV cannot encode the image.
std::vector<uint8_t> encode_jpeg(const cv::Mat &image);

} // namespace edge_transform
