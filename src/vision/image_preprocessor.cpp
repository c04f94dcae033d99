#include <neurolens/vision/image_preprocessor.hpp>
#include "frame_cv_utils.hpp"
#include <neurolens/vision/to_rgb_stage.hpp>
#include <neurolens/vision/load_image.hpp>
#include <neurolens/vision/resize_stage.hpp>
#include <opencv2/core.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <sstream>
#include <string>

namespace neurolens::vision {

namespace nc = neurolens::core;

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  const auto end = std::chrono::steady_clock::now();
  return 1e-3 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
}

}  // namespace

ImagePreprocessor::ImagePreprocessor(PreprocessorOptions options,
                                     nc::Logger logger)
    : options_(options), logger_(std::move(logger)) {
  stages_.push_back(std::make_unique<ToRgbStage>());
  stages_.push_back(
      std::make_unique<ResizeStage>(options_.target_width, options_.target_height));
  stages_.push_back(std::make_unique<NormalizeStage>(options_.mean, options_.std));

  std::ostringstream msg;
  msg << "ImagePreprocessor initialized with target size: " << options_.target_width
      << "x" << options_.target_height;
  logger_.debug(msg.str());
}

std::expected<PreprocessedImage, nc::PipelineFailure>
ImagePreprocessor::preprocess(std::span<const std::byte> bytes,
                              nc::StageTimingCallback* timing_cb) const {
  auto start = std::chrono::steady_clock::now();
  auto decoded = decode_image(bytes);
  if (timing_cb) (*timing_cb)(0, elapsed_ms(start));
  if (!decoded) {
    logger_.warn("Failed to decode image: " + decoded.error().detail);
    return std::unexpected(decoded.error());
  }

  try {
    PreprocessedImage out;
    out.original_size = nc::OriginalDimensions{decoded->height(), decoded->width()};

    nc::Frame current = std::move(*decoded);
    for (std::size_t i = 0; i < stages_.size(); ++i) {
      start = std::chrono::steady_clock::now();
      auto next = stages_[i]->process(current);
      if (timing_cb) (*timing_cb)(i + 1, elapsed_ms(start));
      if (!next) {
        logger_.warn("Preprocessing failed: " + next.error().detail);
        return std::unexpected(next.error());
      }
      current = std::move(*next);
    }

    start = std::chrono::steady_clock::now();
    const std::uint32_t h = current.height();
    const std::uint32_t w = current.width();
    const std::uint32_t c = current.channels();
    std::vector<float> chw(static_cast<std::size_t>(c) * h * w);
    detail::hwc_to_chw(reinterpret_cast<const float*>(current.pixels().data()), h, w, c,
                       chw.data());
    out.tensor = nc::NormalizedTensor(c, h, w, std::move(chw));
    if (timing_cb) (*timing_cb)(stages_.size() + 1, elapsed_ms(start));

    std::ostringstream msg;
    msg << "Preprocessing complete. Original size: (" << out.original_size.height << ", "
        << out.original_size.width << "), Target size: (" << w << ", " << h << ")";
    logger_.info(msg.str());
    return out;
  } catch (const cv::Exception& e) {
    logger_.warn(std::string("Error in preprocessing pipeline: ") + e.what());
    return std::unexpected(nc::PipelineFailure{nc::PipelineError::PreprocessError, e.what()});
  } catch (const std::exception& e) {
    logger_.warn(std::string("Error in preprocessing pipeline: ") + e.what());
    return std::unexpected(nc::PipelineFailure{nc::PipelineError::PreprocessError, e.what()});
  }
}

nc::BBox ImagePreprocessor::denormalize_box(const nc::BBox& box,
                                            nc::OriginalDimensions original_size) const noexcept {
  // Multiply before dividing: exact integer products must not round down.
  auto scale = [](int v, std::uint32_t original, std::uint32_t target) {
    return static_cast<int>(static_cast<double>(v) * original / target);
  };
  return nc::BBox{scale(box.x, original_size.width, options_.target_width),
                  scale(box.y, original_size.height, options_.target_height),
                  scale(box.w, original_size.width, options_.target_width),
                  scale(box.h, original_size.height, options_.target_height)};
}

}  // namespace neurolens::vision
