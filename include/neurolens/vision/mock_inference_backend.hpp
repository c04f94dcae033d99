#pragma once

#include <neurolens/core/detection.hpp>
#include <neurolens/vision/inference_backend.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace neurolens::vision {

/// Scripted backend returning configurable detections or a fault (for tests/demo).
class MockInferenceBackend : public IInferenceBackend {
 public:
  /// Set detections to return on the next infer() call(s).
  void set_detections(std::vector<neurolens::core::Detection> detections);

  /// Make infer() fail with InferenceFault and this message; nullopt clears it.
  void set_failure(std::optional<std::string> message);

  [[nodiscard]] std::expected<InferenceResult, neurolens::core::PipelineFailure>
  infer(const neurolens::core::NormalizedTensor& input) override;

  /// Fails like infer() while a failure is set.
  [[nodiscard]] std::expected<void, neurolens::core::PipelineFailure> warmup() override;

  [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

  [[nodiscard]] std::size_t infer_calls() const noexcept { return infer_calls_; }

 private:
  std::vector<neurolens::core::Detection> detections_to_return_;
  std::optional<std::string> failure_;
  std::size_t infer_calls_{0};
};

}  // namespace neurolens::vision
