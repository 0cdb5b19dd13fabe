#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gdbhub::tags {

// 2-byte big-endian sub-channel tags prefixed to application-mode frames.
constexpr uint16_t ping = 0xFFFF;
constexpr uint16_t info = 0xFFFE;
constexpr uint16_t gdb = 0xFFFD;
constexpr uint16_t reply = 0xFFFC;

constexpr size_t tag_size = 2;

inline std::string encode(uint16_t tag) {
  std::string out(tag_size, '\0');
  out[0] = static_cast<char>((tag >> 8) & 0xff);
  out[1] = static_cast<char>(tag & 0xff);
  return out;
}

inline std::optional<uint16_t> peek(std::string_view frame) {
  if (frame.size() < tag_size) {
    return std::nullopt;
  }
  return static_cast<uint16_t>((static_cast<unsigned char>(frame[0]) << 8) | static_cast<unsigned char>(frame[1]));
}

inline std::string_view name(uint16_t tag) {
  switch (tag) {
  case ping:
    return "ping";
  case info:
    return "info";
  case gdb:
    return "gdb";
  case reply:
    return "reply";
  default:
    return "app";
  }
}

} // namespace gdbhub::tags
