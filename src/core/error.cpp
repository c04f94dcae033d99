#include <neurolens/core/error.hpp>

namespace neurolens::core {

std::string_view to_string(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "None";
    case PipelineError::DecodeError:
      return "DecodeError";
    case PipelineError::PreprocessError:
      return "PreprocessError";
    case PipelineError::InferenceFault:
      return "InferenceFault";
    case PipelineError::AnnotationFailure:
      return "AnnotationFailure";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

bool is_client_fault(PipelineError error) noexcept {
  return error == PipelineError::DecodeError ||
         error == PipelineError::PreprocessError;
}

}  // namespace neurolens::core
