#include <neurolens/vision/simulated_detector.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <thread>

namespace neurolens::vision {

namespace nc = neurolens::core;

namespace {

constexpr double kContrastEpsilon = 1e-5;

constexpr double kPlausiblePositiveRate = 0.90;
constexpr double kImplausiblePositiveRate = 0.20;

struct ConfidenceRange {
  float low;
  float high;
};
constexpr ConfidenceRange kPlausiblePositive{0.80f, 0.98f};
constexpr ConfidenceRange kPlausibleNegative{0.05f, 0.20f};
constexpr ConfidenceRange kImplausiblePositive{0.40f, 0.70f};
constexpr ConfidenceRange kImplausibleNegative{0.05f, 0.30f};

constexpr int kCentreMin = 200;
constexpr int kCentreMax = 400;
constexpr int kSizeMin = 80;
constexpr int kSizeMax = 150;

RandomEngine seeded_engine(const SimulatorOptions& options) {
  if (options.seed) return RandomEngine(*options.seed);
  std::random_device rd;
  return RandomEngine((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
}

}  // namespace

TensorStatistics TensorStatistics::from_moments(double mean, double stddev,
                                                double variance) noexcept {
  return TensorStatistics{mean, stddev, variance, stddev / (mean + kContrastEpsilon)};
}

TensorStatistics compute_statistics(std::span<const float> values) noexcept {
  if (values.empty()) {
    return TensorStatistics::from_moments(0.5, 0.1, 0.0);
  }
  double sum = 0.0;
  for (float v : values) sum += v;
  const double mean = sum / static_cast<double>(values.size());

  double sq = 0.0;
  for (float v : values) {
    const double d = v - mean;
    sq += d * d;
  }
  const double variance = sq / static_cast<double>(values.size());
  return TensorStatistics::from_moments(mean, std::sqrt(variance), variance);
}

bool is_plausible_scan(const TensorStatistics& stats) noexcept {
  return stats.contrast_ratio > 0.01 &&
         stats.mean > 0.05 && stats.mean < 1.0 &&
         stats.stddev > 0.01 &&
         stats.variance > 0.0001;
}

SimulatedDetector::SimulatedDetector(SimulatorOptions options, nc::Logger logger)
    : SimulatedDetector(seeded_engine(options), options.min_latency, std::move(logger)) {}

SimulatedDetector::SimulatedDetector(RandomEngine engine,
                                     std::chrono::milliseconds min_latency,
                                     nc::Logger logger)
    : engine_(std::move(engine)),
      min_latency_(std::max(min_latency, std::chrono::milliseconds::zero())),
      logger_(std::move(logger)) {}

nc::DetectionResult SimulatedDetector::simulate(const nc::NormalizedTensor& tensor) {
  const TensorStatistics stats = compute_statistics(tensor.values());
  const bool plausible = is_plausible_scan(stats);

  std::uniform_real_distribution<double> unit(0.0, 1.0);
  const double positive_rate = plausible ? kPlausiblePositiveRate : kImplausiblePositiveRate;
  const bool positive = unit(engine_) < positive_rate;

  ConfidenceRange range{};
  if (plausible) {
    range = positive ? kPlausiblePositive : kPlausibleNegative;
  } else {
    range = positive ? kImplausiblePositive : kImplausibleNegative;
  }
  std::uniform_real_distribution<float> confidence_dist(range.low, range.high);
  const float confidence = confidence_dist(engine_);

  nc::DetectionResult result = nc::make_empty_result(nc::DetectionSource::Simulated);
  result.simulation = nc::SimulationTrace{stats.mean, stats.stddev, stats.variance,
                                          stats.contrast_ratio, plausible, confidence};

  if (positive) {
    std::uniform_int_distribution<int> centre(kCentreMin, kCentreMax);
    std::uniform_int_distribution<int> size(kSizeMin, kSizeMax);
    const int cx = centre(engine_);
    const int cy = centre(engine_);
    const int w = size(engine_);
    const int h = size(engine_);

    nc::Detection d;
    d.box = nc::BBox{std::max(0, cx - w / 2), std::max(0, cy - h / 2), w, h};
    d.confidence = confidence;
    d.class_id = 0;

    result.found = true;
    result.box = d.box;
    result.confidence = nc::to_percent(confidence);
    result.count = 1;
    result.all.push_back(d);
  }

  std::ostringstream msg;
  msg << std::fixed << std::setprecision(2) << "[SIMULATED] Prediction: found="
      << (positive ? "true" : "false") << ", confidence=" << confidence
      << ", plausible_scan=" << (plausible ? "true" : "false");
  logger_.info(msg.str());
  return result;
}

DetectionRun SimulatedDetector::detect(const nc::NormalizedTensor& tensor) {
  const auto start = std::chrono::steady_clock::now();
  DetectionRun run;
  run.result = simulate(tensor);

  const auto spent = std::chrono::steady_clock::now() - start;
  if (spent < min_latency_) {
    std::this_thread::sleep_for(min_latency_ - spent);
  }
  const auto end = std::chrono::steady_clock::now();
  run.elapsed_ms = 1e-3 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
  return run;
}

}  // namespace neurolens::vision
