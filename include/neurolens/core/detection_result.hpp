#pragma once

#include <neurolens/core/detection.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace neurolens::core {

/// Which detector strategy produced a result.
enum class DetectionSource : std::uint8_t {
  Model,
  Simulated,
};

/// Diagnostics attached to simulated results only.
struct SimulationTrace {
  double mean{0.0};
  double stddev{0.0};
  double variance{0.0};
  double contrast_ratio{0.0};
  bool plausible_scan{false};
  /// Confidence drawn by the simulator (0–1), also when nothing was found.
  float drawn_confidence{0.f};
};

/// Canonical outcome of one detection run.
///
/// Invariant: found == box.has_value() == (count > 0); when !found the
/// confidence is 0 and `all` is empty. `confidence` is a percentage rounded
/// to two decimals, `all` keeps every raw detection in detector order.
struct DetectionResult {
  bool found{false};
  double confidence{0.0};
  std::optional<BBox> box;
  std::size_t count{0};
  std::vector<Detection> all;

  DetectionSource source{DetectionSource::Model};
  /// Set when the detector failed; the result is then a not-found result.
  std::optional<std::string> error;
  std::optional<SimulationTrace> simulation;

  [[nodiscard]] bool is_simulated() const noexcept {
    return source == DetectionSource::Simulated;
  }

  [[nodiscard]] bool satisfies_invariant() const noexcept;
};

/// Not-found result for the given source.
[[nodiscard]] DetectionResult make_empty_result(DetectionSource source);

/// round(confidence * 100, 2)
[[nodiscard]] double to_percent(float confidence) noexcept;

[[nodiscard]] std::string_view to_string(DetectionSource source) noexcept;

}  // namespace neurolens::core
