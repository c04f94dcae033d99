#pragma once

#include <neurolens/core/detection.hpp>
#include <neurolens/vision/inference_result.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace neurolens::vision {

/// Converts InferenceResult corners into Detection records (x, y, w, h).
/// Coordinates are truncated to whole pixels; negative sizes become 0.
/// Every raw detection is kept, in detector order.
class DetectionDecoder {
 public:
  [[nodiscard]] std::vector<neurolens::core::Detection> decode(
      const InferenceResult& result) const;
};

/// Index of the highest-confidence detection (first one on ties), or nullopt if empty.
[[nodiscard]] std::optional<std::size_t> select_best(
    std::span<const neurolens::core::Detection> detections) noexcept;

}  // namespace neurolens::vision
