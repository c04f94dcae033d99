#include <neurolens/vision/model_detector.hpp>
#include <chrono>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace neurolens::vision {

namespace nc = neurolens::core;

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  const auto end = std::chrono::steady_clock::now();
  return 1e-3 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
}

nc::DetectionResult fault_result(std::string message) {
  nc::DetectionResult r = nc::make_empty_result(nc::DetectionSource::Model);
  r.error = std::move(message);
  return r;
}

}  // namespace

ModelDetector::ModelDetector(std::unique_ptr<IInferenceBackend> backend,
                             nc::Logger logger)
    : backend_(std::move(backend)), logger_(std::move(logger)) {
  if (!backend_) {
    throw std::invalid_argument("ModelDetector: backend must not be null");
  }
}

std::string_view ModelDetector::name() const noexcept { return backend_->name(); }

DetectionRun ModelDetector::detect(const nc::NormalizedTensor& tensor) {
  const auto start = std::chrono::steady_clock::now();

  auto valid = backend_->validate_input(tensor);
  if (!valid) {
    logger_.error("Inference input rejected: " + valid.error().detail);
    return {fault_result(valid.error().detail), elapsed_ms(start)};
  }

  auto run_backend = [&]() -> std::expected<InferenceResult, nc::PipelineFailure> {
    try {
      return backend_->infer(tensor);
    } catch (const std::exception& e) {
      return std::unexpected(nc::PipelineFailure{nc::PipelineError::InferenceFault, e.what()});
    }
  };
  auto raw = run_backend();
  if (!raw) {
    logger_.error("Error during inference: " + raw.error().detail);
    return {fault_result(raw.error().detail), elapsed_ms(start)};
  }

  if (!raw->is_consistent()) {
    logger_.error("Backend returned mismatched box/score/class arrays");
    return {fault_result("inconsistent inference result"), elapsed_ms(start)};
  }

  nc::DetectionResult result = nc::make_empty_result(nc::DetectionSource::Model);
  if (raw->num_detections == 0) {
    logger_.info("No finding detected in image");
    return {std::move(result), elapsed_ms(start)};
  }

  result.all = decoder_.decode(*raw);
  result.count = result.all.size();
  if (const auto best = select_best(result.all)) {
    const nc::Detection& winner = result.all[*best];
    result.found = true;
    result.box = winner.box;
    result.confidence = nc::to_percent(winner.confidence);
  }

  const double ms = elapsed_ms(start);
  std::ostringstream msg;
  msg << std::fixed << std::setprecision(2) << "Finding detected with confidence: "
      << result.confidence << "% (" << result.count << " raw detections, " << ms << "ms)";
  logger_.info(msg.str());
  return {std::move(result), ms};
}

}  // namespace neurolens::vision
