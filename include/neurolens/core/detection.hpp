#pragma once

#include <array>
#include <cstdint>

namespace neurolens::core {

/// Axis-aligned box in integer pixel coordinates: top-left corner plus size.
struct BBox {
  int x{0};
  int y{0};
  int w{0};
  int h{0};

  [[nodiscard]] std::array<int, 4> to_array() const noexcept { return {x, y, w, h}; }

  friend bool operator==(const BBox&, const BBox&) = default;
};

/// Single candidate finding in tensor-space: location, confidence (0–1), class.
struct Detection {
  BBox box{};
  float confidence{0.f};
  std::int64_t class_id{0};
};

}  // namespace neurolens::core
