#include <neurolens/vision/normalize_stage.hpp>
#include <cstdint>
#include <cstring>
#include <vector>

namespace neurolens::vision {

NormalizeStage::NormalizeStage(ChannelStats mean, ChannelStats std)
    : mean_(mean), std_(std) {}

std::expected<neurolens::core::Frame, neurolens::core::PipelineFailure>
NormalizeStage::process(const neurolens::core::Frame& input) const {
  using namespace neurolens::core;

  if (!input.is_consistent() || input.format() != PixelFormat::RGB8) {
    return std::unexpected(PipelineFailure{PipelineError::PreprocessError,
                                           "normalize: expected an RGB8 frame"});
  }
  for (float s : std_) {
    if (!(s > 0.f)) {
      return std::unexpected(PipelineFailure{PipelineError::PreprocessError,
                                             "normalize: std must be positive"});
    }
  }

  const std::size_t pixels = static_cast<std::size_t>(input.width()) * input.height();
  const auto* src = reinterpret_cast<const std::uint8_t*>(input.pixels().data());
  std::vector<float> values(pixels * 3);
  for (std::size_t i = 0; i < pixels; ++i) {
    for (std::size_t c = 0; c < 3; ++c) {
      const float scaled = static_cast<float>(src[i * 3 + c]) / 255.f;
      values[i * 3 + c] = (scaled - mean_[c]) / std_[c];
    }
  }

  std::vector<std::byte> buffer(values.size() * sizeof(float));
  std::memcpy(buffer.data(), values.data(), buffer.size());
  return Frame(input.width(), input.height(), PixelFormat::Float32RGB, std::move(buffer));
}

}  // namespace neurolens::vision
