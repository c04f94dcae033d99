#pragma once

#include <neurolens/core/detection_result.hpp>
#include <neurolens/core/tensor.hpp>
#include <string_view>

namespace neurolens::vision {

/// Result of one detector call plus the time it took.
struct DetectionRun {
  neurolens::core::DetectionResult result;
  double elapsed_ms{0.0};
};

/// Detection strategy: genuine model inference or the fallback simulator.
/// Chosen once when the pipeline is built; callers never check which one it is.
/// detect() never throws for detector faults; it reports them in the result.
class IDetector {
 public:
  virtual ~IDetector() = default;

  [[nodiscard]] virtual DetectionRun detect(
      const neurolens::core::NormalizedTensor& tensor) = 0;

  [[nodiscard]] virtual neurolens::core::DetectionSource source() const noexcept = 0;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace neurolens::vision
