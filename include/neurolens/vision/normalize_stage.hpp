#pragma once

#include <neurolens/core/error.hpp>
#include <neurolens/core/frame.hpp>
#include <neurolens/core/pipeline_stage.hpp>
#include <array>
#include <expected>

namespace neurolens::vision {

/// Per-channel statistics used for standardization.
using ChannelStats = std::array<float, 3>;

/// ImageNet channel means / standard deviations (RGB order).
inline constexpr ChannelStats kImageNetMean{0.485f, 0.456f, 0.406f};
inline constexpr ChannelStats kImageNetStd{0.229f, 0.224f, 0.225f};

/// Maps RGB8 pixels to Float32RGB: (value / 255 - mean[c]) / std[c].
class NormalizeStage : public neurolens::core::IPipelineStage {
 public:
  NormalizeStage(ChannelStats mean, ChannelStats std);

  [[nodiscard]] std::expected<neurolens::core::Frame, neurolens::core::PipelineFailure>
  process(const neurolens::core::Frame& input) const override;

 private:
  ChannelStats mean_;
  ChannelStats std_;
};

}  // namespace neurolens::vision
