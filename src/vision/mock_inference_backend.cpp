#include <neurolens/vision/mock_inference_backend.hpp>

namespace neurolens::vision {

void MockInferenceBackend::set_detections(
    std::vector<neurolens::core::Detection> detections) {
  detections_to_return_ = std::move(detections);
}

void MockInferenceBackend::set_failure(std::optional<std::string> message) {
  failure_ = std::move(message);
}

static InferenceResult mock_to_result(
    const std::vector<neurolens::core::Detection>& detections) {
  InferenceResult r;
  for (const auto& d : detections) {
    r.add(static_cast<float>(d.box.x), static_cast<float>(d.box.y),
          static_cast<float>(d.box.x + d.box.w), static_cast<float>(d.box.y + d.box.h),
          d.confidence, d.class_id);
  }
  return r;
}

std::expected<InferenceResult, neurolens::core::PipelineFailure>
MockInferenceBackend::infer(const neurolens::core::NormalizedTensor& /*input*/) {
  ++infer_calls_;
  if (failure_) {
    return std::unexpected(neurolens::core::PipelineFailure{
        neurolens::core::PipelineError::InferenceFault, *failure_});
  }
  return mock_to_result(detections_to_return_);
}

std::expected<void, neurolens::core::PipelineFailure> MockInferenceBackend::warmup() {
  if (failure_) {
    return std::unexpected(neurolens::core::PipelineFailure{
        neurolens::core::PipelineError::InferenceFault, *failure_});
  }
  return {};
}

}  // namespace neurolens::vision
