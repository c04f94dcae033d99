#pragma once

#include <string>
#include <string_view>

namespace neurolens::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  DecodeError,        // empty or unrecognized image bytes (client fault)
  PreprocessError,    // transform failed after decode (client fault)
  InferenceFault,     // detector capability failed (system fault)
  AnnotationFailure,  // overlay could not be produced (non-fatal)
  InvalidConfig,
};

/// Error code plus the underlying cause, for logging and client messages.
struct PipelineFailure {
  PipelineError code{PipelineError::None};
  std::string detail;
};

[[nodiscard]] std::string_view to_string(PipelineError error) noexcept;

/// True for errors caused by the supplied input rather than the system.
[[nodiscard]] bool is_client_fault(PipelineError error) noexcept;

}  // namespace neurolens::core
