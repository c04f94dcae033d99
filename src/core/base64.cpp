#include <neurolens/core/base64.hpp>
#include <cstdint>

namespace neurolens::core {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

}  // namespace

std::string base64_encode(std::span<const std::byte> data) {
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    const std::uint32_t n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                            (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                            std::to_integer<std::uint32_t>(data[i + 2]);
    out.push_back(kAlphabet[(n >> 18) & 0x3f]);
    out.push_back(kAlphabet[(n >> 12) & 0x3f]);
    out.push_back(kAlphabet[(n >> 6) & 0x3f]);
    out.push_back(kAlphabet[n & 0x3f]);
  }

  const std::size_t rest = data.size() - i;
  if (rest == 1) {
    const std::uint32_t n = std::to_integer<std::uint32_t>(data[i]) << 16;
    out.push_back(kAlphabet[(n >> 18) & 0x3f]);
    out.push_back(kAlphabet[(n >> 12) & 0x3f]);
    out.append("==");
  } else if (rest == 2) {
    const std::uint32_t n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                            (std::to_integer<std::uint32_t>(data[i + 1]) << 8);
    out.push_back(kAlphabet[(n >> 18) & 0x3f]);
    out.push_back(kAlphabet[(n >> 12) & 0x3f]);
    out.push_back(kAlphabet[(n >> 6) & 0x3f]);
    out.push_back('=');
  }
  return out;
}

}  // namespace neurolens::core
