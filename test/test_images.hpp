#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace test_images {

// Left part dark, right part bright; the step sits at column `split`.
inline cv::Mat vertical_step(int width, int height, int split, uint8_t dark = 0,
                             uint8_t bright = 255) {
  cv::Mat img(height, width, CV_8UC3, cv::Scalar::all(dark));
  img(cv::Rect(split, 0, width - split, height)).setTo(cv::Scalar::all(bright));
  return img;
}

// Top part dark, bottom part bright; the step sits at row `split`.
inline cv::Mat horizontal_step(int width, int height, int split,
                               uint8_t dark = 30, uint8_t bright = 220) {
  cv::Mat img(height, width, CV_8UC3, cv::Scalar::all(dark));
  img(cv::Rect(0, split, width, height - split)).setTo(cv::Scalar::all(bright));
  return img;
}

inline std::vector<uint8_t> encode(const cv::Mat &img,
                                   const std::string &ext = ".png") {
  std::vector<uint8_t> out;
  cv::imencode(ext, img, out);
  return out;
}

} // namespace test_images
