#pragma once

#include <neurolens/app/config.hpp>
#include <neurolens/core/detection_result.hpp>
#include <neurolens/core/error.hpp>
#include <neurolens/core/logging.hpp>
#include <neurolens/core/pipeline_stage.hpp>
#include <neurolens/core/raw_image.hpp>
#include <neurolens/core/tensor.hpp>
#include <neurolens/vision/annotator.hpp>
#include <neurolens/vision/detector.hpp>
#include <neurolens/vision/image_preprocessor.hpp>
#include <neurolens/vision/inference_backend.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace neurolens::app {

/// Timing indices reported by DetectionPipeline::run after the preprocessing steps (0..4).
inline constexpr std::size_t kDetectStageIndex = 5;
inline constexpr std::size_t kAnnotateStageIndex = 6;

/// Human-readable name for a timing index: decode, to_rgb, resize,
/// normalize, layout, detect, annotate.
[[nodiscard]] std::string_view stage_name(std::size_t index) noexcept;

/// Everything one invocation produces.
struct PipelineOutput {
  neurolens::core::DetectionResult result;
  std::optional<neurolens::vision::AnnotatedImage> annotated;
  /// Detector time (inference plus conversion), in milliseconds.
  double elapsed_ms{0.0};
  neurolens::core::OriginalDimensions original_size;
};

/// Processing context built once at startup: preprocessor, detector strategy
/// and annotator. run() is synchronous; concurrent calls need external
/// serialization because the detector may hold mutable state.
class DetectionPipeline {
 public:
  DetectionPipeline(neurolens::vision::ImagePreprocessor preprocessor,
                    std::unique_ptr<neurolens::vision::IDetector> detector,
                    neurolens::vision::Annotator annotator,
                    bool annotate_in_original_space = false,
                    neurolens::core::Logger logger = {});

  /// Decode and preprocess, detect, then annotate a positive finding.
  /// Decode/preprocess failures are returned as errors; detector faults come
  /// back as a not-found result with `error` set; a failed annotation only
  /// leaves `annotated` empty.
  [[nodiscard]] std::expected<PipelineOutput, neurolens::core::PipelineFailure>
  run(std::span<const std::byte> image_bytes,
      neurolens::core::StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::expected<PipelineOutput, neurolens::core::PipelineFailure>
  run(const neurolens::core::RawImage& image,
      neurolens::core::StageTimingCallback* timing_cb = nullptr) {
    return run(image.view(), timing_cb);
  }

  [[nodiscard]] const neurolens::vision::IDetector& detector() const noexcept { return *detector_; }
  [[nodiscard]] const neurolens::vision::ImagePreprocessor& preprocessor() const noexcept {
    return preprocessor_;
  }
  [[nodiscard]] bool annotates_in_original_space() const noexcept {
    return annotate_in_original_space_;
  }

 private:
  neurolens::vision::ImagePreprocessor preprocessor_;
  std::unique_ptr<neurolens::vision::IDetector> detector_;
  neurolens::vision::Annotator annotator_;
  bool annotate_in_original_space_{false};
  neurolens::core::Logger logger_;
};

/// Builds the inference backend for a config. Throws when the model cannot be loaded.
using BackendLoader = std::function<std::unique_ptr<neurolens::vision::IInferenceBackend>(
    const PipelineConfig& config)>;

/// OnnxInferenceBackend for config.model_path with the configured thresholds.
[[nodiscard]] std::unique_ptr<neurolens::vision::IInferenceBackend> load_onnx_backend(
    const PipelineConfig& config);

/// Choose the detector strategy for \p config (see BackendMode).
/// A model counts as loaded only when the loader succeeds and its warmup passes.
/// Fails with InvalidConfig when backend_type=onnx and the model cannot be loaded.
[[nodiscard]] std::expected<std::unique_ptr<neurolens::vision::IDetector>,
                            neurolens::core::PipelineFailure>
make_detector(const PipelineConfig& config, const neurolens::core::Logger& logger);

/// As above, with \p loader in place of load_onnx_backend.
[[nodiscard]] std::expected<std::unique_ptr<neurolens::vision::IDetector>,
                            neurolens::core::PipelineFailure>
make_detector(const PipelineConfig& config, const neurolens::core::Logger& logger,
              const BackendLoader& loader);

/// Validate \p config and assemble a DetectionPipeline from it.
[[nodiscard]] std::expected<DetectionPipeline, neurolens::core::PipelineFailure>
build_pipeline(const PipelineConfig& config, neurolens::core::Logger logger = {});

/// Callback for each image of a batch: (input index, outcome).
using PipelineOutputCallback = std::function<void(
    std::size_t index,
    const std::expected<PipelineOutput, neurolens::core::PipelineFailure>& outcome)>;

/// Runs the pipeline on each image in order; calls callback for every outcome.
void run_pipeline_batch(DetectionPipeline& pipeline,
                        const std::vector<neurolens::core::RawImage>& images,
                        const PipelineOutputCallback& callback,
                        neurolens::core::StageTimingCallback* timing_cb = nullptr);

}  // namespace neurolens::app
