#include <neurolens/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <neurolens/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace neurolens::vision {

namespace nc = neurolens::core;

std::optional<nc::RawImage> read_raw_image(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;

  std::vector<char> chars((std::istreambuf_iterator<char>(f)),
                          std::istreambuf_iterator<char>());
  if (f.bad()) return std::nullopt;

  nc::RawImage image;
  image.bytes.resize(chars.size());
  std::transform(chars.begin(), chars.end(), image.bytes.begin(),
                 [](char c) { return static_cast<std::byte>(c); });

  std::string ext = std::filesystem::path(path).extension().string();
  if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  image.extension = std::move(ext);
  return image;
}

std::expected<nc::Frame, nc::PipelineFailure>
decode_image(std::span<const std::byte> bytes) {
  if (bytes.empty()) {
    return std::unexpected(nc::PipelineFailure{nc::PipelineError::DecodeError,
                                               "empty image data"});
  }

  cv::Mat decoded;
  try {
    const cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1,
                          const_cast<std::byte*>(bytes.data()));
    decoded = cv::imdecode(encoded, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    return std::unexpected(nc::PipelineFailure{nc::PipelineError::DecodeError, e.what()});
  }
  if (decoded.empty()) {
    return std::unexpected(nc::PipelineFailure{
        nc::PipelineError::DecodeError, "data is not a recognized raster image"});
  }

  return detail::mat_to_frame(decoded, nc::PixelFormat::BGR8);
}

}  // namespace neurolens::vision
