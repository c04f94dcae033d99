#pragma once

#include <neurolens/core/error.hpp>
#include <neurolens/core/frame.hpp>
#include <neurolens/core/raw_image.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>

namespace neurolens::vision {

/// Read an image file into memory without decoding it. Returns nullopt if the
/// file cannot be read.
std::optional<neurolens::core::RawImage> read_raw_image(const std::string& path);

/// Decode encoded image bytes (JPEG, PNG, BMP, GIF, TIFF, ...) into a BGR8 Frame.
/// Empty or unrecognized input fails with PipelineError::DecodeError.
[[nodiscard]] std::expected<neurolens::core::Frame, neurolens::core::PipelineFailure>
decode_image(std::span<const std::byte> bytes);

}  // namespace neurolens::vision
