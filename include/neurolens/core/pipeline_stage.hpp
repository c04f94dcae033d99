#pragma once

#include <neurolens/core/error.hpp>
#include <neurolens/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <functional>

namespace neurolens::core {

/// Callback for per-stage timing: (stage_index, duration_ms).
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Abstract image stage: transform one Frame into the next.
/// Stages hold only configuration, so process() may be called concurrently.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<Frame, PipelineFailure> process(
      const Frame& input) const = 0;
};

}  // namespace neurolens::core
