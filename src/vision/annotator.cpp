#include <neurolens/vision/annotator.hpp>
#include <neurolens/core/base64.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <sstream>

namespace neurolens::vision {

namespace nc = neurolens::core;

namespace {

/// Box colour in the decoded image's own channel layout and depth.
/// Grayscale images get the colour's luma, alpha channels stay opaque.
cv::Scalar draw_color(const cv::Mat& image, const std::array<std::uint8_t, 3>& rgb) {
  const double unit = image.depth() == CV_16U ? 257.0 : 1.0;
  const double r = rgb[0] * unit;
  const double g = rgb[1] * unit;
  const double b = rgb[2] * unit;
  switch (image.channels()) {
    case 1:
      return cv::Scalar((r * 299 + g * 587 + b * 114) / 1000);
    case 4:
      return cv::Scalar(b, g, r, 255 * unit);
    default:
      return cv::Scalar(b, g, r);
  }
}

}  // namespace

std::string AnnotatedImage::data_uri() const {
  return "data:image/png;base64," + nc::base64_encode(png);
}

Annotator::Annotator(AnnotatorOptions options, nc::Logger logger)
    : options_(std::move(options)), logger_(std::move(logger)) {}

std::optional<AnnotatedImage> Annotator::annotate(std::span<const std::byte> original_bytes,
                                                  std::span<const int> box,
                                                  bool found) const {
  if (!found || box.size() < 4) return std::nullopt;

  const int x = box[0];
  const int y = box[1];
  const int w = box[2];
  const int h = box[3];

  std::ostringstream where;
  where << "x=" << x << ", y=" << y << ", w=" << w << ", h=" << h;
  logger_.debug("Drawing finding box at " + where.str());

  if (original_bytes.empty()) {
    logger_.warn("Cannot annotate: original image is empty");
    return std::nullopt;
  }

  try {
    const cv::Mat encoded(1, static_cast<int>(original_bytes.size()), CV_8UC1,
                          const_cast<std::byte*>(original_bytes.data()));
    // Keep the upload as stored: channels, bit depth and orientation.
    cv::Mat image = cv::imdecode(encoded, cv::IMREAD_UNCHANGED | cv::IMREAD_IGNORE_ORIENTATION);
    if (image.empty()) {
      logger_.warn("Cannot annotate: original image could not be decoded");
      return std::nullopt;
    }
    if (image.depth() != CV_8U && image.depth() != CV_16U) {
      image.convertTo(image, CV_8U);
    }

    const cv::Scalar color = draw_color(image, options_.color_rgb);
    cv::rectangle(image, cv::Point(x, y), cv::Point(x + w, y + h), color,
                  options_.stroke_width, cv::LINE_8);

    if (!options_.label.empty()) {
      constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;
      constexpr double kScale = 0.5;
      constexpr int kThickness = 1;
      int baseline = 0;
      const cv::Size text = cv::getTextSize(options_.label, kFont, kScale, kThickness, &baseline);
      const int top = std::max(0, y - options_.label_offset);
      cv::putText(image, options_.label, cv::Point(std::max(0, x), top + text.height), kFont,
                  kScale, color, kThickness, cv::LINE_AA);
    }

    std::vector<std::uint8_t> png;
    if (!cv::imencode(".png", image, png)) {
      logger_.error("Cannot annotate: PNG encoding failed");
      return std::nullopt;
    }

    AnnotatedImage out;
    out.png.resize(png.size());
    std::memcpy(out.png.data(), png.data(), png.size());
    logger_.info("Finding box drawn successfully");
    return out;
  } catch (const cv::Exception& e) {
    logger_.error(std::string("Error drawing finding box: ") + e.what());
    return std::nullopt;
  }
}

std::optional<AnnotatedImage> Annotator::annotate(std::span<const std::byte> original_bytes,
                                                  const nc::DetectionResult& result) const {
  if (!result.box) return annotate(original_bytes, std::span<const int>{}, result.found);
  const auto box = result.box->to_array();
  return annotate(original_bytes, box, result.found);
}

}  // namespace neurolens::vision
