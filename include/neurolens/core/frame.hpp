#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace neurolens::core {

/// Pixel encoding of a Frame. Every format is interleaved (HWC) with tightly packed rows.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  Float32RGB,  // standardized values, three floats per pixel
};

/// Decoded image travelling between preprocessing stages.
///
/// Owns its pixels in one contiguous buffer; stages never modify their input
/// and always hand back a new Frame.
class Frame {
 public:
  Frame() = default;

  /// Takes ownership of \p pixels. The row stride is width * bytes_per_pixel(format).
  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> pixels)
      : width_(width),
        height_(height),
        format_(format),
        pixels_(std::move(pixels)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept { return channel_count(format_); }
  [[nodiscard]] std::size_t row_stride() const noexcept {
    return static_cast<std::size_t>(width_) * bytes_per_pixel(format_);
  }

  [[nodiscard]] std::span<const std::byte> pixels() const noexcept {
    return std::span<const std::byte>(pixels_.data(), pixels_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return pixels_.size(); }

  /// Non-empty, known format, and at least height * row_stride() bytes.
  [[nodiscard]] bool is_consistent() const noexcept;

  [[nodiscard]] static std::uint32_t channel_count(PixelFormat format) noexcept;
  [[nodiscard]] static std::size_t bytes_per_pixel(PixelFormat format) noexcept;

  /// Bytes needed for a width x height image in \p format.
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> pixels_;
};

}  // namespace neurolens::core
