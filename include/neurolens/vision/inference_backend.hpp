#pragma once

#include <neurolens/core/error.hpp>
#include <neurolens/core/tensor.hpp>
#include <neurolens/vision/inference_result.hpp>
#include <expected>
#include <string_view>

namespace neurolens::vision {

/// Confidence and IoU (overlap suppression) cutoffs fixed when a backend is built.
struct DetectorThresholds {
  float confidence{0.5f};
  float iou{0.45f};
};

/// Abstract detector capability: NormalizedTensor -> InferenceResult.
/// Implement infer(); optionally override validate_input and warmup.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Single-tensor inference. Failures are reported as InferenceFault.
  [[nodiscard]] virtual std::expected<InferenceResult, neurolens::core::PipelineFailure>
  infer(const neurolens::core::NormalizedTensor& input) = 0;

  /// Optional: validate tensor shape before infer. Default: accept non-empty tensors.
  [[nodiscard]] virtual std::expected<void, neurolens::core::PipelineFailure>
  validate_input(const neurolens::core::NormalizedTensor& input) const;

  /// Optional: warmup run (e.g. dummy inference). Call once after construction.
  /// A failure means the backend cannot serve requests. Default: no-op.
  [[nodiscard]] virtual std::expected<void, neurolens::core::PipelineFailure> warmup() {
    return {};
  }

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace neurolens::vision
