#include "test_images.hpp"
#include <neurolens/core/error.hpp>
#include <neurolens/core/frame.hpp>
#include <neurolens/vision/image_preprocessor.hpp>
#include <neurolens/vision/load_image.hpp>
#include <neurolens/vision/normalize_stage.hpp>
#include <neurolens/vision/resize_stage.hpp>
#include <neurolens/vision/to_rgb_stage.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace nv = neurolens::vision;
namespace nc = neurolens::core;
namespace nt = neurolens::testing;

namespace {

/// Largest |value - expected| over one channel plane.
float max_plane_deviation(const nc::NormalizedTensor& t, std::uint32_t c, float expected) {
  float worst = 0.f;
  for (float v : t.plane(c)) worst = std::max(worst, std::abs(v - expected));
  return worst;
}

}  // namespace

TEST(ImagePreprocessor, BlackImageGivesStandardizedZeros) {
  const auto png = nt::encode_png(nt::solid_image(2, 2, cv::Scalar(0, 0, 0)));
  nv::ImagePreprocessor pre;
  auto out = pre.preprocess(png);
  ASSERT_TRUE(out.has_value()) << out.error().detail;

  EXPECT_EQ(out->tensor.channels(), 3u);
  EXPECT_EQ(out->tensor.height(), 640u);
  EXPECT_EQ(out->tensor.width(), 640u);
  for (std::uint32_t c = 0; c < 3; ++c) {
    const float expected = (0.f - nv::kImageNetMean[c]) / nv::kImageNetStd[c];
    EXPECT_LT(max_plane_deviation(out->tensor, c, expected), 1e-5f) << "channel " << c;
  }
}

TEST(ImagePreprocessor, ChannelsAreRgbOrdered) {
  // BGR scalar: blue 128, green 0, red 255.
  const auto png = nt::encode_png(nt::solid_image(1, 1, cv::Scalar(128, 0, 255)));
  nv::ImagePreprocessor pre(nv::PreprocessorOptions{8, 8, nv::kImageNetMean, nv::kImageNetStd});
  auto out = pre.preprocess(png);
  ASSERT_TRUE(out.has_value());
  EXPECT_NEAR(out->tensor.at(0, 3, 3), (1.f - 0.485f) / 0.229f, 1e-4f);
  EXPECT_NEAR(out->tensor.at(1, 3, 3), (0.f - 0.456f) / 0.224f, 1e-4f);
  EXPECT_NEAR(out->tensor.at(2, 3, 3), (128.f / 255.f - 0.406f) / 0.225f, 1e-4f);
}

TEST(ImagePreprocessor, RecordsOriginalSizeAndTargetShape) {
  const auto png = nt::encode_png(nt::solid_image(30, 20, cv::Scalar(10, 20, 30)));
  nv::ImagePreprocessor pre(nv::PreprocessorOptions{64, 32, nv::kImageNetMean, nv::kImageNetStd});
  auto out = pre.preprocess(png);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->original_size.width, 30u);
  EXPECT_EQ(out->original_size.height, 20u);
  EXPECT_EQ(out->tensor.width(), 64u);
  EXPECT_EQ(out->tensor.height(), 32u);
}

TEST(ImagePreprocessor, Deterministic) {
  cv::Mat image(17, 23, CV_8UC3);
  cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(255));
  const auto png = nt::encode_png(image);
  nv::ImagePreprocessor pre;
  auto a = pre.preprocess(png);
  auto b = pre.preprocess(png);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  ASSERT_EQ(a->tensor.size(), b->tensor.size());
  EXPECT_EQ(std::memcmp(a->tensor.values().data(), b->tensor.values().data(),
                        a->tensor.size() * sizeof(float)),
            0);
}

TEST(ImagePreprocessor, EmptyBytesAreDecodeError) {
  nv::ImagePreprocessor pre;
  auto out = pre.preprocess({});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().code, nc::PipelineError::DecodeError);
}

TEST(ImagePreprocessor, GarbageBytesAreDecodeError) {
  const std::vector<std::byte> junk(64, std::byte{0x5a});
  nv::ImagePreprocessor pre;
  auto out = pre.preprocess(junk);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().code, nc::PipelineError::DecodeError);
  EXPECT_FALSE(out.error().detail.empty());
}

TEST(ImagePreprocessor, ZeroTargetSizeIsPreprocessError) {
  const auto png = nt::encode_png(nt::solid_image(4, 4, cv::Scalar(1, 2, 3)));
  nv::ImagePreprocessor pre(nv::PreprocessorOptions{0, 640, nv::kImageNetMean, nv::kImageNetStd});
  auto out = pre.preprocess(png);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().code, nc::PipelineError::PreprocessError);
}

TEST(ImagePreprocessor, ReportsTimingForEveryStep) {
  const auto png = nt::encode_png(nt::solid_image(8, 8, cv::Scalar(1, 2, 3)));
  std::vector<std::size_t> steps;
  nc::StageTimingCallback cb = [&](std::size_t idx, double ms) {
    steps.push_back(idx);
    EXPECT_GE(ms, 0.0);
  };
  nv::ImagePreprocessor pre;
  ASSERT_TRUE(pre.preprocess(png, &cb).has_value());
  EXPECT_EQ(steps, (std::vector<std::size_t>{0, 1, 2, 3, 4}));
}

TEST(ImagePreprocessor, DenormalizeBoxScalesToOriginal) {
  nv::ImagePreprocessor pre;
  const nc::BBox tensor_box{100, 200, 50, 64};
  const auto b = pre.denormalize_box(tensor_box, nc::OriginalDimensions{320, 1280});
  EXPECT_EQ(b, (nc::BBox{200, 100, 100, 32}));
}

TEST(ImagePreprocessor, DenormalizeBoxKeepsExactProducts) {
  nv::ImagePreprocessor pre;
  // 360 * 224 / 640 == 126 exactly; scaling by 224/640 first lands just below.
  const auto b = pre.denormalize_box(nc::BBox{360, 360, 640, 1}, nc::OriginalDimensions{224, 224});
  EXPECT_EQ(b, (nc::BBox{126, 126, 224, 0}));
}

TEST(DecodeImage, ProducesBgrFrame) {
  const auto png = nt::encode_png(nt::solid_image(5, 3, cv::Scalar(1, 2, 3)));
  auto frame = nv::decode_image(png);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->width(), 5u);
  EXPECT_EQ(frame->height(), 3u);
  EXPECT_EQ(frame->format(), nc::PixelFormat::BGR8);
  EXPECT_EQ(std::to_integer<int>(frame->pixels()[0]), 1);
  EXPECT_EQ(std::to_integer<int>(frame->pixels()[2]), 3);
}

TEST(ResizeStage, RejectsUnsupportedFormat) {
  nv::ResizeStage resize(4, 4);
  auto out = resize.process(nc::Frame{});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().code, nc::PipelineError::PreprocessError);
}

TEST(ToRgbStage, SwapsRedAndBlue) {
  std::vector<std::byte> buf{std::byte{1}, std::byte{2}, std::byte{3}};
  nc::Frame bgr(1, 1, nc::PixelFormat::BGR8, std::move(buf));
  nv::ToRgbStage convert;
  auto out = convert.process(bgr);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), nc::PixelFormat::RGB8);
  EXPECT_EQ(std::to_integer<int>(out->pixels()[0]), 3);
  EXPECT_EQ(std::to_integer<int>(out->pixels()[2]), 1);
}

TEST(ToRgbStage, ExpandsGrayscale) {
  std::vector<std::byte> buf{std::byte{7}, std::byte{9}};
  nc::Frame gray(2, 1, nc::PixelFormat::Grayscale8, std::move(buf));
  nv::ToRgbStage convert;
  auto out = convert.process(gray);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->size_bytes(), 6u);
  EXPECT_EQ(std::to_integer<int>(out->pixels()[3]), 9);
  EXPECT_EQ(std::to_integer<int>(out->pixels()[5]), 9);
}

TEST(ToRgbStage, RejectsFloatFrames) {
  std::vector<std::byte> buf(3 * sizeof(float));
  nc::Frame f(1, 1, nc::PixelFormat::Float32RGB, std::move(buf));
  nv::ToRgbStage convert;
  auto out = convert.process(f);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().code, nc::PipelineError::PreprocessError);
}

TEST(NormalizeStage, OutputsFloatRgb) {
  std::vector<std::byte> buf{std::byte{255}, std::byte{0}, std::byte{51}};
  nc::Frame rgb(1, 1, nc::PixelFormat::RGB8, std::move(buf));
  nv::NormalizeStage normalize({0.5f, 0.5f, 0.5f}, {0.5f, 0.5f, 0.5f});
  auto out = normalize.process(rgb);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), nc::PixelFormat::Float32RGB);
  ASSERT_EQ(out->size_bytes(), 3 * sizeof(float));
  float values[3];
  std::memcpy(values, out->pixels().data(), sizeof(values));
  EXPECT_NEAR(values[0], 1.f, 1e-6f);
  EXPECT_NEAR(values[1], -1.f, 1e-6f);
  EXPECT_NEAR(values[2], (0.2f - 0.5f) / 0.5f, 1e-6f);
}
