#include <neurolens/vision/to_rgb_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <optional>
#include <vector>

namespace neurolens::vision {

namespace nc = neurolens::core;

namespace {

std::optional<int> conversion_to_rgb(nc::PixelFormat format) {
  switch (format) {
    case nc::PixelFormat::BGR8:
      return cv::COLOR_BGR2RGB;
    case nc::PixelFormat::Grayscale8:
      return cv::COLOR_GRAY2RGB;
    default:
      return std::nullopt;
  }
}

nc::PipelineFailure failure(const char* detail) {
  return nc::PipelineFailure{nc::PipelineError::PreprocessError, detail};
}

}  // namespace

std::expected<nc::Frame, nc::PipelineFailure> ToRgbStage::process(const nc::Frame& input) const {
  if (!input.is_consistent()) {
    return std::unexpected(failure("to_rgb: frame is empty or truncated"));
  }
  if (input.format() == nc::PixelFormat::RGB8) {
    const auto px = input.pixels();
    return nc::Frame(input.width(), input.height(), nc::PixelFormat::RGB8,
                     std::vector<std::byte>(px.begin(), px.end()));
  }

  const auto code = conversion_to_rgb(input.format());
  const auto src = detail::frame_to_mat(input);
  if (!code || !src) {
    return std::unexpected(failure("to_rgb: unsupported pixel format"));
  }
  cv::Mat rgb;
  cv::cvtColor(*src, rgb, *code);
  return detail::mat_to_frame(rgb, nc::PixelFormat::RGB8);
}

}  // namespace neurolens::vision
