#include "gdbhub/protocol/rsp_core.hpp"

#include <iterator>

#include <fmt/format.h>

namespace gdbhub::rsp {

namespace {

constexpr std::string_view k_digits = "0123456789abcdef";
constexpr std::string_view k_monitor_prefix = "qRcmd,";

int nibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// A '#' preceded by an odd run of escape markers is itself escaped.
bool escaped_at(std::string_view data, size_t pos) {
  auto before = data.substr(0, pos);
  auto last_other = before.find_last_not_of(escape_char);
  size_t markers = last_other == std::string_view::npos ? before.size() : before.size() - last_other - 1;
  return (markers % 2) == 1;
}

void append_hex_byte(std::string& out, uint8_t value) {
  out.push_back(k_digits[value >> 4]);
  out.push_back(k_digits[value & 0x0f]);
}

} // namespace

bool needs_escape(char c) { return c == '#' || c == '$' || c == '}' || c == '*'; }

std::string escape(std::string_view data) {
  std::string out;
  out.reserve(data.size());
  for (char c : data) {
    if (needs_escape(c)) {
      out.push_back(escape_char);
    }
    out.push_back(c);
  }
  return out;
}

std::string unescape(std::string_view data) {
  std::string out;
  out.reserve(data.size());
  for (size_t i = 0; i < data.size(); ++i) {
    if (data[i] == escape_char && i + 1 < data.size()) {
      out.push_back(data[i + 1]);
      ++i;
    } else {
      out.push_back(data[i]);
    }
  }
  return out;
}

uint8_t checksum(std::string_view data) {
  uint8_t sum = 0;
  for (unsigned char c : data) {
    sum = static_cast<uint8_t>(sum + c);
  }
  return sum;
}

std::string wrap(std::string_view payload) {
  auto escaped = escape(payload);
  uint8_t sum = checksum(escaped);
  std::string packet;
  packet.reserve(escaped.size() + 5);
  packet.push_back(ack_char);
  packet.push_back(packet_start);
  packet += escaped;
  packet.push_back(packet_end);
  append_hex_byte(packet, sum);
  return packet;
}

std::string unwrap(std::string_view packet) {
  while (!packet.empty() && (packet.front() == ack_char || packet.front() == nack_char)) {
    packet.remove_prefix(1);
  }
  if (!packet.empty() && packet.front() == packet_start) {
    packet.remove_prefix(1);
  }

  for (size_t i = 0; i < packet.size(); ++i) {
    if (packet[i] == escape_char) {
      ++i;
      continue;
    }
    if (packet[i] == packet_end) {
      packet = packet.substr(0, i);
      break;
    }
  }
  return unescape(packet);
}

bool is_complete(std::string_view buffer) {
  if (buffer.size() == 1 && buffer.front() == ack_char) {
    return true;
  }
  if (buffer.size() < 3) {
    return false;
  }
  size_t hash = buffer.size() - 3;
  return buffer[hash] == packet_end && !escaped_at(buffer, hash);
}

std::optional<std::string> parse_monitor_command(std::string_view packet) {
  if (packet.size() == 1 && packet.front() == ack_char) {
    return std::nullopt;
  }
  auto payload = unwrap(packet);
  if (payload.compare(0, k_monitor_prefix.size(), k_monitor_prefix) != 0) {
    return std::nullopt;
  }
  return decode_hex(std::string_view(payload).substr(k_monitor_prefix.size()));
}

std::string hex_csv(std::string_view code, std::span<const uint64_t> args, std::string_view payload) {
  std::string body(code);
  for (uint64_t arg : args) {
    fmt::format_to(std::back_inserter(body), "{:X},", arg);
  }
  body.append(payload.data(), payload.size());
  return wrap(body);
}

std::optional<std::string> decode_hex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

std::string encode_hex(std::string_view data) {
  std::string out;
  out.reserve(data.size() * 2);
  for (unsigned char c : data) {
    append_hex_byte(out, c);
  }
  return out;
}

bool assembler::append(std::string_view chunk) {
  buffer_.append(chunk.data(), chunk.size());
  return complete();
}

bool assembler::complete() const { return is_complete(buffer_); }

std::string assembler::take() {
  std::string out = std::move(buffer_);
  buffer_.clear();
  return out;
}

void assembler::reset() { buffer_.clear(); }

} // namespace gdbhub::rsp
