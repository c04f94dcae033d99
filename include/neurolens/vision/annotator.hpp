#pragma once

#include <neurolens/core/detection_result.hpp>
#include <neurolens/core/logging.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace neurolens::vision {

/// PNG-encoded copy of the original image with the finding drawn in.
struct AnnotatedImage {
  std::vector<std::byte> png;

  /// "data:image/png;base64,..." for direct embedding.
  [[nodiscard]] std::string data_uri() const;
};

struct AnnotatorOptions {
  std::string label{"TUMOR DETECTED"};
  int stroke_width{4};
  std::array<std::uint8_t, 3> color_rgb{255, 0, 0};
  /// Label top edge sits this many pixels above the box (clamped to the image top).
  int label_offset{25};
};

/// Draws a finding's box and label on the original (pre-resize) image.
///
/// The box is drawn exactly as given: callers pass tensor-space boxes unless
/// they rescale them first (see ImagePreprocessor::denormalize_box).
/// All failures are logged and reported as nullopt.
class Annotator {
 public:
  explicit Annotator(AnnotatorOptions options = {}, neurolens::core::Logger logger = {});

  /// nullopt when !found, when box has fewer than 4 values, or on any
  /// decode/draw/encode failure. box = [x, y, width, height].
  [[nodiscard]] std::optional<AnnotatedImage> annotate(
      std::span<const std::byte> original_bytes,
      std::span<const int> box,
      bool found) const;

  [[nodiscard]] std::optional<AnnotatedImage> annotate(
      std::span<const std::byte> original_bytes,
      const neurolens::core::DetectionResult& result) const;

  [[nodiscard]] const AnnotatorOptions& options() const noexcept { return options_; }

 private:
  AnnotatorOptions options_;
  neurolens::core::Logger logger_;
};

}  // namespace neurolens::vision
