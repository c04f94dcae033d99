#pragma once

#include <neurolens/core/detection.hpp>
#include <neurolens/core/error.hpp>
#include <neurolens/core/logging.hpp>
#include <neurolens/core/pipeline_stage.hpp>
#include <neurolens/core/tensor.hpp>
#include <neurolens/vision/normalize_stage.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

namespace neurolens::vision {

/// Target tensor size and standardization constants.
struct PreprocessorOptions {
  std::uint32_t target_width{640};
  std::uint32_t target_height{640};
  ChannelStats mean{kImageNetMean};
  ChannelStats std{kImageNetStd};
};

/// Output of preprocessing: detector input plus the size of the source image.
struct PreprocessedImage {
  neurolens::core::NormalizedTensor tensor;
  neurolens::core::OriginalDimensions original_size;
};

/// Decodes raw image bytes into a (3, target_height, target_width) tensor.
///
/// Steps: decode -> BGR to RGB -> bilinear stretch to the target size ->
/// (x/255 - mean)/std per channel -> channel-first layout.
/// Decode failures are reported as DecodeError, anything after that as
/// PreprocessError carrying the cause. Stateless after construction, so
/// preprocess() may be called from several threads.
class ImagePreprocessor {
 public:
  explicit ImagePreprocessor(PreprocessorOptions options = {},
                             neurolens::core::Logger logger = {});

  /// If timing_cb is non-null it receives (step_index, duration_ms) for
  /// decode (0), each image stage (1..3) and the layout transform (4).
  [[nodiscard]] std::expected<PreprocessedImage, neurolens::core::PipelineFailure>
  preprocess(std::span<const std::byte> bytes,
             neurolens::core::StageTimingCallback* timing_cb = nullptr) const;

  /// Scale a tensor-space box back to original-space (truncating).
  [[nodiscard]] neurolens::core::BBox denormalize_box(
      const neurolens::core::BBox& box,
      neurolens::core::OriginalDimensions original_size) const noexcept;

  [[nodiscard]] const PreprocessorOptions& options() const noexcept { return options_; }

 private:
  PreprocessorOptions options_;
  neurolens::core::Logger logger_;
  std::vector<std::unique_ptr<neurolens::core::IPipelineStage>> stages_;
};

}  // namespace neurolens::vision
