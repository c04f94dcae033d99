#include <neurolens/core/detection_result.hpp>
#include <cmath>

namespace neurolens::core {

bool DetectionResult::satisfies_invariant() const noexcept {
  if (found) {
    return box.has_value() && count > 0 && !all.empty();
  }
  return !box.has_value() && count == 0 && all.empty() && confidence == 0.0;
}

DetectionResult make_empty_result(DetectionSource source) {
  DetectionResult r;
  r.source = source;
  return r;
}

double to_percent(float confidence) noexcept {
  return std::round(static_cast<double>(confidence) * 100.0 * 100.0) / 100.0;
}

std::string_view to_string(DetectionSource source) noexcept {
  switch (source) {
    case DetectionSource::Model:
      return "model";
    case DetectionSource::Simulated:
      return "simulated";
  }
  return "unknown";
}

}  // namespace neurolens::core
