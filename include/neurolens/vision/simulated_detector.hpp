#pragma once

#include <neurolens/core/logging.hpp>
#include <neurolens/vision/detector.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <span>

namespace neurolens::vision {

/// Population statistics over every value of a tensor.
struct TensorStatistics {
  double mean{0.0};
  double stddev{0.0};
  double variance{0.0};
  double contrast_ratio{0.0};  // stddev / (mean + 1e-5)

  [[nodiscard]] static TensorStatistics from_moments(double mean, double stddev,
                                                     double variance) noexcept;
};

/// Empty input yields mean 0.5, stddev 0.1, variance 0.
[[nodiscard]] TensorStatistics compute_statistics(std::span<const float> values) noexcept;

/// Heuristic "looks like a real scan" test:
/// contrast_ratio > 0.01, 0.05 < mean < 1.0, stddev > 0.01, variance > 0.0001.
[[nodiscard]] bool is_plausible_scan(const TensorStatistics& stats) noexcept;

using RandomEngine = std::mt19937_64;

struct SimulatorOptions {
  /// Reported latency never drops below this (approximates real inference).
  std::chrono::milliseconds min_latency{300};
  /// Fixed seed for reproducible draws; random_device when unset.
  std::optional<std::uint64_t> seed;
};

/// Fallback detector used when no model is available.
///
/// Draws a finding from image statistics alone: plausible scans are positive
/// 90% of the time with confidence in [0.80, 0.98] (else [0.05, 0.20]), other
/// images 20% of the time with [0.40, 0.70] (else [0.05, 0.30]). Positive
/// boxes are 80–150 px wide/high, centred in [200, 400]^2 tensor pixels.
/// Results carry DetectionSource::Simulated and a SimulationTrace.
/// Holds an RNG, so concurrent detect() calls need external serialization.
class SimulatedDetector : public IDetector {
 public:
  explicit SimulatedDetector(SimulatorOptions options = {},
                             neurolens::core::Logger logger = {});

  /// Inject the entropy source directly.
  SimulatedDetector(RandomEngine engine,
                    std::chrono::milliseconds min_latency,
                    neurolens::core::Logger logger = {});

  /// simulate() plus the artificial minimum latency.
  [[nodiscard]] DetectionRun detect(
      const neurolens::core::NormalizedTensor& tensor) override;

  /// One draw, no latency.
  [[nodiscard]] neurolens::core::DetectionResult simulate(
      const neurolens::core::NormalizedTensor& tensor);

  [[nodiscard]] neurolens::core::DetectionSource source() const noexcept override {
    return neurolens::core::DetectionSource::Simulated;
  }

  [[nodiscard]] std::string_view name() const noexcept override { return "simulated"; }

  [[nodiscard]] std::chrono::milliseconds min_latency() const noexcept { return min_latency_; }

 private:
  RandomEngine engine_;
  std::chrono::milliseconds min_latency_;
  neurolens::core::Logger logger_;
};

}  // namespace neurolens::vision
