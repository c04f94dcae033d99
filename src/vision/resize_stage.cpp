#include <neurolens/vision/resize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>

namespace neurolens::vision {

namespace nc = neurolens::core;

ResizeStage::ResizeStage(std::uint32_t target_width, std::uint32_t target_height)
    : width_(target_width), height_(target_height) {}

std::expected<nc::Frame, nc::PipelineFailure> ResizeStage::process(const nc::Frame& input) const {
  if (width_ == 0 || height_ == 0) {
    return std::unexpected(nc::PipelineFailure{nc::PipelineError::PreprocessError,
                                               "resize: target size must be positive"});
  }
  const auto src = detail::frame_to_mat(input);
  if (!src) {
    return std::unexpected(nc::PipelineFailure{nc::PipelineError::PreprocessError,
                                               "resize: frame is empty or has no known format"});
  }

  // cv::resize copies when the size already matches.
  cv::Mat dst;
  cv::resize(*src, dst, cv::Size(static_cast<int>(width_), static_cast<int>(height_)), 0.0,
             0.0, cv::INTER_LINEAR);
  return detail::mat_to_frame(dst, input.format());
}

}  // namespace neurolens::vision
