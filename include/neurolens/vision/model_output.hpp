#pragma once

#include <neurolens/core/error.hpp>
#include <neurolens/vision/inference_backend.hpp>
#include <neurolens/vision/inference_result.hpp>
#include <cstdint>
#include <expected>
#include <span>

namespace neurolens::vision {

/// Decode a detection model's first output tensor into corner boxes.
///
/// \p shape must be rank 3 with batch 1. Supported layouts:
/// - [1, N, 6] / [1, 6, N]: (x1, y1, x2, y2, score, class_id) per detection.
/// - [1, 4+C, N] (channel-major) / [1, N, 4+C]: (cx, cy, w, h) then C class scores;
///   the best class wins.
/// Candidates below thresholds.confidence are dropped, then NMS with thresholds.iou
/// runs per class. Kept detections are ordered by descending score.
/// Any other shape, or a buffer whose size does not match \p shape, is an InferenceFault.
[[nodiscard]] std::expected<InferenceResult, neurolens::core::PipelineFailure>
decode_model_output(std::span<const float> data, std::span<const std::int64_t> shape,
                    const DetectorThresholds& thresholds);

}  // namespace neurolens::vision
