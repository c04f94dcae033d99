#pragma once

#include <neurolens/core/error.hpp>
#include <neurolens/core/logging.hpp>
#include <neurolens/vision/normalize_stage.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace neurolens::app {

/// Detector strategy selection.
enum class BackendMode {
  Auto,       // model if it loads, simulator otherwise
  Onnx,       // model required
  Simulated,  // always the simulator
};

/// Pipeline configuration: model, tensor geometry, thresholds, simulator and logging.
struct PipelineConfig {
  std::string model_path{"model/yolov8n.onnx"};
  BackendMode backend_type{BackendMode::Auto};
  std::uint32_t target_width{640};
  std::uint32_t target_height{640};
  neurolens::vision::ChannelStats normalize_mean{neurolens::vision::kImageNetMean};
  neurolens::vision::ChannelStats normalize_std{neurolens::vision::kImageNetStd};
  float confidence_threshold{0.5f};
  float iou_threshold{0.45f};
  std::uint32_t simulated_latency_ms{300};
  std::optional<std::uint64_t> simulator_seed;
  /// Rescale boxes to the uploaded image before drawing them.
  bool annotate_in_original_space{false};
  /// Accepted for compatibility; there is no prediction cache.
  bool cache_predictions{false};
  neurolens::core::LogLevel log_level{neurolens::core::LogLevel::Info};
};

/// Looks up an environment variable; nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// Default config when no file is provided.
PipelineConfig default_config();

/// Load config from a simple key=value file (one per line, '#' comments).
/// A missing file yields the defaults; unknown keys are ignored; a malformed
/// value fails with InvalidConfig naming the key.
[[nodiscard]] std::expected<PipelineConfig, neurolens::core::PipelineFailure>
load_config(const std::string& path);

/// Apply MODEL_PATH, CONFIDENCE_THRESHOLD, IOU_THRESHOLD, DETECTOR_BACKEND,
/// SIMULATOR_SEED and LOG_LEVEL. Uses the process environment when \p lookup is empty.
[[nodiscard]] std::expected<void, neurolens::core::PipelineFailure>
apply_env_overrides(PipelineConfig& config, const EnvLookup& lookup = {});

/// Reject non-positive target sizes or std values and thresholds outside [0, 1].
[[nodiscard]] std::expected<void, neurolens::core::PipelineFailure>
validate_config(const PipelineConfig& config);

[[nodiscard]] std::optional<BackendMode> parse_backend_mode(std::string_view text);

[[nodiscard]] std::string_view to_string(BackendMode mode) noexcept;

}  // namespace neurolens::app
