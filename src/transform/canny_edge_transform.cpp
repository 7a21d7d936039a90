#include "transform/canny_edge_transform.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <string>

namespace edge_transform {

cv::Mat decode_image(const std::vector<uint8_t> &payload) {
  if (payload.empty()) {
    throw InvalidImageError("empty payload");
  }

  cv::Mat image;
  try {
    image = cv::imdecode(payload, cv::IMREAD_COLOR);
  } catch (const cv::Exception &e) {
    throw InvalidImageError(e.what());
  }
  if (image.empty()) {
    throw InvalidImageError("unrecognized or corrupt image encoding (" +
                            std::to_string(payload.size()) + " bytes)");
  }
  return image;
}

cv::Mat detect_edges(const cv::Mat &image, int32_t threshold1,
                     int32_t threshold2) {
  cv::Mat edges;
  cv::Canny(image, edges, threshold1, threshold2);
  return edges;
}

std::vector<uint8_t> encode_jpeg(const cv::Mat &image) {
  std::vector<uint8_t> out;
  try {
    if (!cv::imencode(".jpg", image, out)) {
      throw TransformError("failed to encode edge map as JPEG");
    }
  } catch (const cv::Exception &e) {
    throw TransformError(std::string("failed to encode edge map as JPEG: ") +
                         e.what());
  }
  return out;
}

std::vector<uint8_t>
CannyEdgeTransform::apply(const std::vector<uint8_t> &payload,
                          int32_t min_threshold, int32_t max_threshold) {
  const cv::Mat image = decode_image(payload);
  return encode_jpeg(detect_edges(image, min_threshold, max_threshold));
}

} // namespace edge_transform
