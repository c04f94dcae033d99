#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace neurolens::core {

/// (height, width) of the decoded image before any resize.
struct OriginalDimensions {
  std::uint32_t height{0};
  std::uint32_t width{0};
};

/// Channel-first (C, H, W) float32 tensor fed to a detector.
/// Immutable after construction; values are laid out plane by plane.
class NormalizedTensor {
 public:
  NormalizedTensor() = default;

  /// \p values must hold exactly channels*height*width floats; otherwise the
  /// tensor is left empty.
  NormalizedTensor(std::uint32_t channels,
                   std::uint32_t height,
                   std::uint32_t width,
                   std::vector<float> values);

  [[nodiscard]] std::uint32_t channels() const noexcept { return channels_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }

  [[nodiscard]] std::span<const float> values() const noexcept {
    return std::span<const float>(values_.data(), values_.size());
  }
  /// One channel plane (height*width values).
  [[nodiscard]] std::span<const float> plane(std::uint32_t channel) const;

  [[nodiscard]] float at(std::uint32_t channel, std::uint32_t y, std::uint32_t x) const {
    return values_[(static_cast<std::size_t>(channel) * height_ + y) * width_ + x];
  }

  [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

 private:
  std::uint32_t channels_{0};
  std::uint32_t height_{0};
  std::uint32_t width_{0};
  std::vector<float> values_;
};

}  // namespace neurolens::core
