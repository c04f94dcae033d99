#include <neurolens/vision/detection_decoder.hpp>
#include <algorithm>
#include <cstdint>
#include <iterator>

namespace neurolens::vision {

std::vector<neurolens::core::Detection> DetectionDecoder::decode(
    const InferenceResult& result) const {
  std::vector<neurolens::core::Detection> out;
  const std::size_t n = static_cast<std::size_t>(result.num_detections);
  out.reserve(n);

  for (std::size_t i = 0; i < n; ++i) {
    neurolens::core::Detection d;
    d.confidence = i < result.scores.size() ? result.scores[i] : 0.f;
    d.class_id = i < result.class_ids.size() ? std::max<std::int64_t>(result.class_ids[i], 0) : 0;
    if (i * 4 + 3 < result.boxes.size()) {
      const float x1 = result.boxes[i * 4 + 0];
      const float y1 = result.boxes[i * 4 + 1];
      const float x2 = result.boxes[i * 4 + 2];
      const float y2 = result.boxes[i * 4 + 3];
      d.box.x = static_cast<int>(x1);
      d.box.y = static_cast<int>(y1);
      d.box.w = std::max(0, static_cast<int>(x2 - x1));
      d.box.h = std::max(0, static_cast<int>(y2 - y1));
    }
    out.push_back(d);
  }
  return out;
}

std::optional<std::size_t> select_best(
    std::span<const neurolens::core::Detection> detections) noexcept {
  if (detections.empty()) return std::nullopt;
  const auto it = std::max_element(
      detections.begin(), detections.end(),
      [](const auto& a, const auto& b) { return a.confidence < b.confidence; });
  return static_cast<std::size_t>(std::distance(detections.begin(), it));
}

}  // namespace neurolens::vision
