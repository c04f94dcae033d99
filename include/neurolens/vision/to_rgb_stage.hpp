#pragma once

#include <neurolens/core/error.hpp>
#include <neurolens/core/frame.hpp>
#include <neurolens/core/pipeline_stage.hpp>
#include <expected>

namespace neurolens::vision {

/// Brings a decoded 8-bit frame to RGB8: BGR8 is reordered, Grayscale8 is
/// replicated into three channels, RGB8 passes through unchanged.
class ToRgbStage : public neurolens::core::IPipelineStage {
 public:
  [[nodiscard]] std::expected<neurolens::core::Frame, neurolens::core::PipelineFailure>
  process(const neurolens::core::Frame& input) const override;
};

}  // namespace neurolens::vision
