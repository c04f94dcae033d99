#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace neurolens::core {

/// Standard base64 (RFC 4648) with '=' padding.
[[nodiscard]] std::string base64_encode(std::span<const std::byte> data);

}  // namespace neurolens::core
