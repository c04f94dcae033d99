#include "frame_cv_utils.hpp"
#include <neurolens/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace neurolens::vision::detail {

namespace nc = neurolens::core;

std::optional<cv::Mat> frame_to_mat(const nc::Frame& frame) {
  if (!frame.is_consistent()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.row_stride();
  void* data = const_cast<std::byte*>(frame.pixels().data());

  switch (frame.format()) {
    case nc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case nc::PixelFormat::RGB8:
    case nc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case nc::PixelFormat::Float32RGB:
      return cv::Mat(h, w, CV_32FC3, data, step);
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

nc::Frame mat_to_frame(const cv::Mat& mat, nc::PixelFormat format) {
  if (mat.empty()) return nc::Frame();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(contiguous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(contiguous.rows);
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return nc::Frame(w, h, format, std::move(buffer));
}

void hwc_to_chw(const float* hwc, std::uint32_t h, std::uint32_t w,
                std::uint32_t channels, float* chw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::size_t i = 0; i < hw; ++i) {
    for (std::uint32_t c = 0; c < channels; ++c) {
      chw[c * hw + i] = hwc[i * channels + c];
    }
  }
}

void chw_to_hwc(const float* chw, std::uint32_t h, std::uint32_t w,
                std::uint32_t channels, float* hwc) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::size_t i = 0; i < hw; ++i) {
    for (std::uint32_t c = 0; c < channels; ++c) {
      hwc[i * channels + c] = chw[c * hw + i];
    }
  }
}

}  // namespace neurolens::vision::detail
