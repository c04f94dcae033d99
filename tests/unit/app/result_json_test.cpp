#include <neurolens/app/detection_pipeline.hpp>
#include <neurolens/app/result_json.hpp>
#include <neurolens/core/detection_result.hpp>
#include <neurolens/core/error.hpp>
#include <gtest/gtest.h>
#include <string>

namespace na = neurolens::app;
namespace nc = neurolens::core;

namespace {

nc::DetectionResult found_result() {
  nc::DetectionResult r;
  r.found = true;
  r.box = nc::BBox{100, 120, 50, 60};
  r.confidence = 90.0;
  r.count = 2;
  r.all.push_back(nc::Detection{{10, 10, 5, 5}, 0.3f, 0});
  r.all.push_back(nc::Detection{*r.box, 0.9f, 1});
  return r;
}

}  // namespace

TEST(ResultJson, FoundResult) {
  const nlohmann::json j = na::to_json(found_result());
  EXPECT_TRUE(j.at("found").get<bool>());
  EXPECT_DOUBLE_EQ(j.at("confidence").get<double>(), 90.0);
  EXPECT_EQ(j.at("box"), nlohmann::json::array({100, 120, 50, 60}));
  EXPECT_EQ(j.at("count").get<std::size_t>(), 2u);
  ASSERT_EQ(j.at("all").size(), 2u);
  EXPECT_NEAR(j.at("all")[0].at("confidence").get<double>(), 0.3, 1e-6);
  EXPECT_NEAR(j.at("all")[1].at("confidence").get<double>(), 0.9, 1e-6);
  EXPECT_EQ(j.at("all")[1].at("class").get<int>(), 1);
  EXPECT_EQ(j.at("source"), "model");
  EXPECT_FALSE(j.contains("error"));
}

TEST(ResultJson, NotFoundHasEmptyBox) {
  const nlohmann::json j = na::to_json(nc::make_empty_result(nc::DetectionSource::Simulated));
  EXPECT_FALSE(j.at("found").get<bool>());
  EXPECT_TRUE(j.at("box").is_array());
  EXPECT_TRUE(j.at("box").empty());
  EXPECT_EQ(j.at("count").get<int>(), 0);
  EXPECT_TRUE(j.at("all").empty());
  EXPECT_EQ(j.at("source"), "simulated");
}

TEST(ResultJson, DetectorFaultHidesDetail) {
  nc::DetectionResult r = nc::make_empty_result(nc::DetectionSource::Model);
  r.error = "session crashed at /opt/models/yolov8n.onnx";
  const nlohmann::json j = na::to_json(r);
  ASSERT_TRUE(j.contains("error"));
  EXPECT_FALSE(j.at("found").get<bool>());
  EXPECT_EQ(j.dump().find("/opt/models"), std::string::npos);
  EXPECT_EQ(j.dump().find("session crashed"), std::string::npos);
}

TEST(ResultJson, DetectorFaultOutputIsError) {
  na::PipelineOutput out;
  out.result = nc::make_empty_result(nc::DetectionSource::Model);
  out.result.error = "onnxruntime: CUDA OOM at 0x7ffd";
  const nlohmann::json j = na::to_json(out);
  EXPECT_EQ(j.at("status"), "error");
  EXPECT_EQ(j.at("code"), "InferenceFault");
  EXPECT_EQ(j.at("error"), "Model inference failed. Please check logs.");
  EXPECT_EQ(j.dump().find("CUDA"), std::string::npos);
}

TEST(ResultJson, PipelineOutput) {
  na::PipelineOutput out;
  out.result = found_result();
  out.elapsed_ms = 12.3456;
  out.original_size = nc::OriginalDimensions{480, 640};
  const nlohmann::json j = na::to_json(out);
  EXPECT_EQ(j.at("status"), "success");
  EXPECT_FALSE(j.contains("code"));
  EXPECT_DOUBLE_EQ(j.at("processing_time_ms").get<double>(), 12.35);
  EXPECT_TRUE(j.at("annotated_image").is_null());
  EXPECT_FALSE(j.at("simulated").get<bool>());
  EXPECT_EQ(j.at("original_size").at("width").get<int>(), 640);
  EXPECT_EQ(j.at("original_size").at("height").get<int>(), 480);
  EXPECT_TRUE(j.at("found").get<bool>());
}

TEST(ResultJson, AnnotatedImageIsDataUri) {
  na::PipelineOutput out;
  out.result = found_result();
  out.annotated = neurolens::vision::AnnotatedImage{{std::byte{'a'}, std::byte{'b'}}};
  const nlohmann::json j = na::to_json(out);
  EXPECT_EQ(j.at("annotated_image"), "data:image/png;base64,YWI=");
}

TEST(ResultJson, ClientFaultKeepsDetail) {
  const nlohmann::json j =
      na::to_json(nc::PipelineFailure{nc::PipelineError::DecodeError, "not an image"});
  EXPECT_EQ(j.at("status"), "error");
  EXPECT_EQ(j.at("code"), "DecodeError");
  EXPECT_NE(j.at("error").get<std::string>().find("not an image"), std::string::npos);
}

TEST(ResultJson, SystemFaultIsGeneric) {
  const nlohmann::json j =
      na::to_json(nc::PipelineFailure{nc::PipelineError::InferenceFault, "secret stack trace"});
  EXPECT_EQ(j.at("status"), "error");
  EXPECT_EQ(j.at("code"), "InferenceFault");
  EXPECT_EQ(j.at("error").get<std::string>().find("secret"), std::string::npos);
}
