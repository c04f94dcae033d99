#pragma once

#include <neurolens/core/error.hpp>
#include <neurolens/core/frame.hpp>
#include <neurolens/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>

namespace neurolens::vision {

/// Bilinear stretch to target_width x target_height. The aspect ratio is not
/// preserved, so boxes found on the output are anisotropically scaled with
/// respect to the source image.
class ResizeStage : public neurolens::core::IPipelineStage {
 public:
  ResizeStage(std::uint32_t target_width, std::uint32_t target_height);

  [[nodiscard]] std::expected<neurolens::core::Frame, neurolens::core::PipelineFailure>
  process(const neurolens::core::Frame& input) const override;

  [[nodiscard]] std::uint32_t target_width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t target_height() const noexcept { return height_; }

 private:
  std::uint32_t width_;
  std::uint32_t height_;
};

}  // namespace neurolens::vision
