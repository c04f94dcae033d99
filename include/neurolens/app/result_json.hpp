#pragma once

#include <neurolens/app/detection_pipeline.hpp>
#include <neurolens/core/detection.hpp>
#include <neurolens/core/detection_result.hpp>
#include <neurolens/core/error.hpp>
#include <nlohmann/json.hpp>

namespace neurolens::app {

/// {box: [x,y,w,h], confidence: 0-1, class}
[[nodiscard]] nlohmann::json to_json(const neurolens::core::Detection& detection);

/// {found, confidence, box: [x,y,w,h] or [], count, all, source, error?}
/// A detector fault sets `error` to a generic message, never the fault detail.
[[nodiscard]] nlohmann::json to_json(const neurolens::core::DetectionResult& result);

/// Result fields plus status, processing_time_ms (2 decimals),
/// annotated_image (data URI or null), simulated and original_size.
/// status is "success", or "error" with code "InferenceFault" when the
/// detector failed.
[[nodiscard]] nlohmann::json to_json(const PipelineOutput& output);

/// {status: "error", code, error}. Client faults carry their detail; system
/// faults only a generic message.
[[nodiscard]] nlohmann::json to_json(const neurolens::core::PipelineFailure& failure);

}  // namespace neurolens::app
