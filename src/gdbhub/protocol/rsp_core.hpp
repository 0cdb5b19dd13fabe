#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gdbhub::rsp {

constexpr char packet_start = '$';
constexpr char packet_end = '#';
constexpr char escape_char = '}';
constexpr char ack_char = '+';
constexpr char nack_char = '-';

// The stub escapes '#', '$', '}' and '*' by prefixing '}' and passing the
// character through unchanged.
bool needs_escape(char c);
std::string escape(std::string_view data);
std::string unescape(std::string_view data);

uint8_t checksum(std::string_view data);

// "+$" + escape(payload) + "#" + checksum. The leading '+' acknowledges the
// packet the peer sent before.
std::string wrap(std::string_view payload);

// Drops ack/nack markers and the checksum (not verified) and unescapes.
std::string unwrap(std::string_view packet);

// True for a bare ack, or a buffer ending in '#' plus two checksum digits.
bool is_complete(std::string_view buffer);

// Text of a qRcmd monitor command, if the packet is one.
std::optional<std::string> parse_monitor_command(std::string_view packet);

// Builds code + hex(arg) + "," for every arg, followed by payload, wrapped.
std::string hex_csv(std::string_view code, std::span<const uint64_t> args, std::string_view payload);

// Lowercase on output; either case accepted on input.
std::string encode_hex(std::string_view data);
std::optional<std::string> decode_hex(std::string_view hex);

// Concatenates input chunks until is_complete() holds for the accumulated
// buffer. Relies on chunks not straddling packet borders.
class assembler {
public:
  bool append(std::string_view chunk);
  bool complete() const;
  std::string take();
  const std::string& buffer() const { return buffer_; }
  void reset();

private:
  std::string buffer_;
};

} // namespace gdbhub::rsp
