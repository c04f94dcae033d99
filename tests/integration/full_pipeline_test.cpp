#include "test_images.hpp"
#include <neurolens/app/config.hpp>
#include <neurolens/app/detection_pipeline.hpp>
#include <neurolens/app/result_json.hpp>
#include <neurolens/core/detection_result.hpp>
#include <neurolens/core/logging.hpp>
#include <neurolens/vision/annotator.hpp>
#include <neurolens/vision/image_preprocessor.hpp>
#include <neurolens/vision/mock_inference_backend.hpp>
#include <neurolens/vision/model_detector.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace neurolens::core;
using namespace neurolens::vision;
using namespace neurolens::app;
namespace nt = neurolens::testing;

/// Pipeline whose detector always reports the given tensor-space detections.
DetectionPipeline build_mock_pipeline(std::vector<Detection> detections,
                                      bool original_space = false,
                                      std::optional<std::string> failure = std::nullopt) {
  auto mock = std::make_unique<MockInferenceBackend>();
  mock->set_detections(std::move(detections));
  mock->set_failure(std::move(failure));
  return DetectionPipeline(ImagePreprocessor(), std::make_unique<ModelDetector>(std::move(mock)),
                           Annotator(), original_space);
}

std::vector<std::byte> gray_png(int w, int h) {
  return nt::encode_png(nt::solid_image(w, h, cv::Scalar(128, 128, 128)));
}

}  // namespace

TEST(FullPipeline, BlackImageThroughSimulator) {
  PipelineConfig cfg = default_config();
  cfg.backend_type = BackendMode::Simulated;
  cfg.simulated_latency_ms = 0;
  cfg.simulator_seed = 2024;
  auto pipeline = build_pipeline(cfg);
  ASSERT_TRUE(pipeline.has_value()) << pipeline.error().detail;

  const auto png = nt::encode_png(nt::solid_image(2, 2, cv::Scalar(0, 0, 0)));
  auto out = pipeline->run(png);
  ASSERT_TRUE(out.has_value()) << out.error().detail;
  EXPECT_TRUE(out->result.satisfies_invariant());
  EXPECT_TRUE(out->result.is_simulated());
  ASSERT_TRUE(out->result.simulation.has_value());
  EXPECT_FALSE(out->result.simulation->plausible_scan);
  EXPECT_EQ(out->original_size.width, 2u);
  EXPECT_EQ(out->original_size.height, 2u);
  EXPECT_EQ(out->annotated.has_value(), out->result.found);
}

TEST(FullPipeline, ModelFindingIsAnnotatedInTensorSpace) {
  DetectionPipeline pipeline = build_mock_pipeline({
      {{10, 10, 20, 20}, 0.4f, 0},
      {{100, 100, 50, 50}, 0.9f, 0},
  });
  // 1280x640 original: tensor-space and original-space boxes differ on x.
  auto out = pipeline.run(gray_png(1280, 640));
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->result.found);
  EXPECT_DOUBLE_EQ(out->result.confidence, 90.0);
  EXPECT_EQ(*out->result.box, (BBox{100, 100, 50, 50}));
  EXPECT_EQ(out->result.count, 2u);
  ASSERT_TRUE(out->annotated.has_value());

  const cv::Mat drawn = nt::decode_png(out->annotated->png);
  ASSERT_EQ(drawn.cols, 1280);
  ASSERT_EQ(drawn.rows, 640);
  EXPECT_TRUE(nt::is_red(drawn, 100, 125));
  EXPECT_FALSE(nt::is_red(drawn, 200, 125));
}

TEST(FullPipeline, OriginalSpaceAnnotationIsOptIn) {
  DetectionPipeline pipeline = build_mock_pipeline({{{100, 100, 50, 50}, 0.9f, 0}},
                                                   /*original_space=*/true);
  auto out = pipeline.run(gray_png(1280, 640));
  ASSERT_TRUE(out.has_value());
  // The reported box stays in tensor space; only the drawing is rescaled.
  EXPECT_EQ(*out->result.box, (BBox{100, 100, 50, 50}));
  ASSERT_TRUE(out->annotated.has_value());

  const cv::Mat drawn = nt::decode_png(out->annotated->png);
  EXPECT_TRUE(nt::is_red(drawn, 200, 125));
  EXPECT_FALSE(nt::is_red(drawn, 100, 125));
}

TEST(FullPipeline, NoFindingMeansNoAnnotation) {
  DetectionPipeline pipeline = build_mock_pipeline({});
  auto out = pipeline.run(gray_png(32, 32));
  ASSERT_TRUE(out.has_value());
  EXPECT_FALSE(out->result.found);
  EXPECT_FALSE(out->annotated.has_value());
  EXPECT_TRUE(to_json(*out).at("annotated_image").is_null());
}

TEST(FullPipeline, InferenceFaultIsReportedInResult) {
  std::vector<std::pair<LogLevel, std::string>> logged;
  Logger logger(
      [&](LogLevel level, std::string_view msg) { logged.emplace_back(level, std::string(msg)); },
      LogLevel::Debug);
  auto mock = std::make_unique<MockInferenceBackend>();
  mock->set_failure("accelerator unavailable");
  DetectionPipeline pipeline(ImagePreprocessor({}, logger),
                             std::make_unique<ModelDetector>(std::move(mock), logger),
                             Annotator({}, logger), false, logger);

  auto out = pipeline.run(gray_png(32, 32));
  ASSERT_TRUE(out.has_value());
  EXPECT_FALSE(out->result.found);
  ASSERT_TRUE(out->result.error.has_value());
  EXPECT_FALSE(out->annotated.has_value());
  EXPECT_TRUE(out->result.satisfies_invariant());

  bool error_logged = false;
  for (const auto& [level, msg] : logged) {
    if (level == LogLevel::Error && msg.find("accelerator unavailable") != std::string::npos) {
      error_logged = true;
    }
  }
  EXPECT_TRUE(error_logged);
}

TEST(FullPipeline, InferenceFaultJsonKeepsDetailOut) {
  const std::string internal = "onnxruntime: /opt/models/internal/yolov8n.onnx: CUDA OOM at 0x7ffd";
  DetectionPipeline pipeline = build_mock_pipeline({}, false, internal);
  auto out = pipeline.run(gray_png(32, 32));
  ASSERT_TRUE(out.has_value());
  ASSERT_TRUE(out->result.error.has_value());

  const nlohmann::json j = to_json(*out);
  EXPECT_EQ(j.at("status"), "error");
  EXPECT_EQ(j.at("code"), "InferenceFault");
  EXPECT_FALSE(j.at("found").get<bool>());
  const std::string dumped = j.dump();
  EXPECT_EQ(dumped.find("/opt/models"), std::string::npos);
  EXPECT_EQ(dumped.find("CUDA OOM"), std::string::npos);
}

TEST(FullPipeline, StageTimingCallbackInvoked) {
  DetectionPipeline pipeline = build_mock_pipeline({{{5, 5, 10, 10}, 0.8f, 0}});
  std::vector<std::pair<std::size_t, double>> timings;
  StageTimingCallback timing_cb = [&](std::size_t idx, double ms) {
    timings.emplace_back(idx, ms);
  };

  auto out = pipeline.run(gray_png(64, 64), &timing_cb);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(timings.size(), 7u);  // decode, 3 image stages, layout, detect, annotate
  for (std::size_t i = 0; i < timings.size(); ++i) {
    EXPECT_EQ(timings[i].first, i);
    EXPECT_GE(timings[i].second, 0.0);
  }
}

TEST(FullPipeline, JsonDocumentForFinding) {
  DetectionPipeline pipeline = build_mock_pipeline({{{5, 5, 10, 10}, 0.8f, 0}});
  auto out = pipeline.run(gray_png(64, 64));
  ASSERT_TRUE(out.has_value());
  const nlohmann::json j = to_json(*out);
  EXPECT_EQ(j.at("status"), "success");
  EXPECT_DOUBLE_EQ(j.at("confidence").get<double>(), 80.0);
  EXPECT_EQ(j.at("box"), nlohmann::json::array({5, 5, 10, 10}));
  ASSERT_EQ(j.at("all").size(), 1u);
  EXPECT_NEAR(j.at("all")[0].at("confidence").get<double>(), 0.8, 1e-6);
  EXPECT_EQ(j.at("annotated_image").get<std::string>().rfind("data:image/png;base64,", 0), 0u);
  EXPECT_FALSE(j.at("simulated").get<bool>());
}
