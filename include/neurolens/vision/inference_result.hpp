#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace neurolens::vision {

/// Backend output after thresholding and overlap suppression, before
/// conversion to Detection records. Boxes are tensor-space corners
/// [x1, y1, x2, y2], four floats per detection.
struct InferenceResult {
  std::vector<float> boxes;
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};

  void add(float x1, float y1, float x2, float y2, float score, std::int64_t class_id) {
    boxes.insert(boxes.end(), {x1, y1, x2, y2});
    scores.push_back(score);
    class_ids.push_back(class_id);
    ++num_detections;
  }

  /// Every array holds exactly num_detections entries.
  [[nodiscard]] bool is_consistent() const noexcept {
    const std::size_t n = num_detections;
    return boxes.size() == n * 4 && scores.size() == n && class_ids.size() == n;
  }
};

}  // namespace neurolens::vision
