#pragma once

#include <neurolens/core/logging.hpp>
#include <neurolens/vision/detection_decoder.hpp>
#include <neurolens/vision/detector.hpp>
#include <neurolens/vision/inference_backend.hpp>
#include <memory>

namespace neurolens::vision {

/// Detection adapter around a real inference backend.
///
/// Runs the backend, converts every raw box to (x, y, w, h), and reports the
/// highest-confidence one as the finding (confidence as a percentage).
/// Backend faults become a not-found result with `error` set.
/// Not safe for concurrent detect() calls unless the backend is.
class ModelDetector : public IDetector {
 public:
  explicit ModelDetector(std::unique_ptr<IInferenceBackend> backend,
                         neurolens::core::Logger logger = {});

  [[nodiscard]] DetectionRun detect(
      const neurolens::core::NormalizedTensor& tensor) override;

  [[nodiscard]] neurolens::core::DetectionSource source() const noexcept override {
    return neurolens::core::DetectionSource::Model;
  }

  [[nodiscard]] std::string_view name() const noexcept override;

 private:
  std::unique_ptr<IInferenceBackend> backend_;
  DetectionDecoder decoder_;
  neurolens::core::Logger logger_;
};

}  // namespace neurolens::vision
