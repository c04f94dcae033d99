#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace neurolens::core {

/// Encoded image as received from the outside world; the extension is
/// informational only, the decoder sniffs the actual format.
struct RawImage {
  std::vector<std::byte> bytes;
  std::string extension;  // lower-case, without the dot, e.g. "png"

  [[nodiscard]] std::span<const std::byte> view() const noexcept {
    return std::span<const std::byte>(bytes.data(), bytes.size());
  }
  [[nodiscard]] bool empty() const noexcept { return bytes.empty(); }
};

}  // namespace neurolens::core
