#pragma once

// PNG helpers shared by the image-based tests.
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace neurolens::testing {

/// Solid BGR image of the given size.
inline cv::Mat solid_image(int width, int height, cv::Scalar bgr) {
  return cv::Mat(height, width, CV_8UC3, bgr);
}

inline std::vector<std::byte> encode_png(const cv::Mat& image) {
  std::vector<uchar> buf;
  cv::imencode(".png", image, buf);
  std::vector<std::byte> out(buf.size());
  std::memcpy(out.data(), buf.data(), buf.size());
  return out;
}

inline cv::Mat decode_png(const std::vector<std::byte>& png) {
  const cv::Mat encoded(1, static_cast<int>(png.size()), CV_8UC1,
                        const_cast<std::byte*>(png.data()));
  return cv::imdecode(encoded, cv::IMREAD_COLOR);
}

/// True if pixel (x, y) is pure red.
inline bool is_red(const cv::Mat& bgr, int x, int y) {
  const cv::Vec3b px = bgr.at<cv::Vec3b>(y, x);
  return px[0] == 0 && px[1] == 0 && px[2] == 255;
}

}  // namespace neurolens::testing
