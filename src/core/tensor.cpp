#include <neurolens/core/tensor.hpp>
#include <stdexcept>

namespace neurolens::core {

NormalizedTensor::NormalizedTensor(std::uint32_t channels,
                                   std::uint32_t height,
                                   std::uint32_t width,
                                   std::vector<float> values) {
  const std::size_t expected = static_cast<std::size_t>(channels) * height * width;
  if (expected == 0 || values.size() != expected) return;
  channels_ = channels;
  height_ = height;
  width_ = width;
  values_ = std::move(values);
}

std::span<const float> NormalizedTensor::plane(std::uint32_t channel) const {
  if (channel >= channels_) {
    throw std::out_of_range("NormalizedTensor::plane: channel out of range");
  }
  const std::size_t hw = static_cast<std::size_t>(height_) * width_;
  return values().subspan(channel * hw, hw);
}

}  // namespace neurolens::core
