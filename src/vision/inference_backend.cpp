#include <neurolens/vision/inference_backend.hpp>

namespace neurolens::vision {

std::expected<void, neurolens::core::PipelineFailure>
IInferenceBackend::validate_input(const neurolens::core::NormalizedTensor& input) const {
  if (input.empty()) {
    return std::unexpected(neurolens::core::PipelineFailure{
        neurolens::core::PipelineError::InferenceFault, "empty input tensor"});
  }
  return {};
}

}  // namespace neurolens::vision
