#include <neurolens/app/result_json.hpp>
#include <cmath>
#include <string>

namespace neurolens::app {

namespace nc = neurolens::core;

namespace {

constexpr const char* kInferenceFaultMessage = "Model inference failed. Please check logs.";

double round2(double value) { return std::round(value * 100.0) / 100.0; }

}  // namespace

nlohmann::json to_json(const nc::Detection& detection) {
  return nlohmann::json{
      {"box", detection.box.to_array()},
      {"confidence", detection.confidence},
      {"class", detection.class_id},
  };
}

nlohmann::json to_json(const nc::DetectionResult& result) {
  nlohmann::json j;
  j["found"] = result.found;
  j["confidence"] = result.confidence;
  j["box"] = result.box ? nlohmann::json(result.box->to_array()) : nlohmann::json::array();
  j["count"] = result.count;

  nlohmann::json all = nlohmann::json::array();
  for (const auto& d : result.all) all.push_back(to_json(d));
  j["all"] = std::move(all);

  j["source"] = std::string(nc::to_string(result.source));
  // The detector's own message stays in the log.
  if (result.error) j["error"] = kInferenceFaultMessage;
  return j;
}

nlohmann::json to_json(const PipelineOutput& output) {
  nlohmann::json j = to_json(output.result);
  if (output.result.error) {
    j["status"] = "error";
    j["code"] = std::string(nc::to_string(nc::PipelineError::InferenceFault));
  } else {
    j["status"] = "success";
  }
  j["processing_time_ms"] = round2(output.elapsed_ms);
  j["annotated_image"] = output.annotated ? nlohmann::json(output.annotated->data_uri())
                                          : nlohmann::json(nullptr);
  j["simulated"] = output.result.is_simulated();
  j["original_size"] = {{"width", output.original_size.width},
                        {"height", output.original_size.height}};
  return j;
}

nlohmann::json to_json(const nc::PipelineFailure& failure) {
  std::string message;
  switch (failure.code) {
    case nc::PipelineError::DecodeError:
      message = "Invalid image: " + failure.detail;
      break;
    case nc::PipelineError::PreprocessError:
      message = "Image preprocessing failed: " + failure.detail;
      break;
    case nc::PipelineError::InvalidConfig:
      message = "Invalid configuration: " + failure.detail;
      break;
    case nc::PipelineError::InferenceFault:
      message = kInferenceFaultMessage;
      break;
    default:
      message = "Internal error during detection. Please check logs.";
      break;
  }
  return nlohmann::json{
      {"status", "error"},
      {"code", std::string(nc::to_string(failure.code))},
      {"error", std::move(message)},
  };
}

}  // namespace neurolens::app
