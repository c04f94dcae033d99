#include <neurolens/core/frame.hpp>

namespace neurolens::core {

std::uint32_t Frame::channel_count(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
    case PixelFormat::Float32RGB:
      return 3;
    case PixelFormat::Unknown:
      break;
  }
  return 0;
}

std::size_t Frame::bytes_per_pixel(PixelFormat format) noexcept {
  const std::size_t sample = format == PixelFormat::Float32RGB ? sizeof(float) : 1u;
  return sample * channel_count(format);
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) noexcept {
  return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
}

bool Frame::is_consistent() const noexcept {
  const std::size_t needed = min_bytes(width_, height_, format_);
  return needed > 0 && pixels_.size() >= needed;
}

}  // namespace neurolens::core
