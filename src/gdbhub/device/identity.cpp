#include "gdbhub/device/identity.hpp"

#include <cctype>
#include <regex>
#include <vector>

#include <fmt/core.h>

namespace gdbhub {

namespace {

std::vector<std::string_view> split(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (start <= text.size()) {
    auto next = text.find(sep, start);
    auto part = text.substr(start, next == std::string_view::npos ? text.size() - start : next - start);
    if (!part.empty()) {
      parts.push_back(part);
    }
    if (next == std::string_view::npos) {
      break;
    }
    start = next + 1;
  }
  return parts;
}

std::vector<std::string_view> split_words(std::string_view text) {
  std::vector<std::string_view> words;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
      ++i;
    }
    size_t start = i;
    while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
      ++i;
    }
    if (i > start) {
      words.push_back(text.substr(start, i - start));
    }
  }
  return words;
}

// "<bus>-<port>[.<port>...]"
bool is_usb_port(std::string_view text) {
  auto dash = text.find('-');
  if (dash == std::string_view::npos || dash == 0 || dash + 1 >= text.size()) {
    return false;
  }
  for (size_t i = 0; i < dash; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  bool digit_seen = false;
  for (size_t i = dash + 1; i < text.size(); ++i) {
    char c = text[i];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digit_seen = true;
    } else if (c == '.' && digit_seen) {
      digit_seen = false;
    } else {
      return false;
    }
  }
  return digit_seen;
}

} // namespace

std::string device_id::str() const {
  return fmt::format("{}:{}:{}", host, usb_port ? "usb" : "tty", location);
}

std::optional<std::string> devpath_usb_port(std::string_view devpath) {
  for (auto segment : split(devpath, '/')) {
    auto colon = segment.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    auto port = segment.substr(0, colon);
    if (is_usb_port(port)) {
      return std::string(port);
    }
  }
  return std::nullopt;
}

device_id resolve_identity(const attach_notification& device) {
  if (auto port = devpath_usb_port(device.devpath)) {
    return device_id{device.host, std::move(*port), true};
  }
  return device_id{device.host, device.tty, false};
}

uint64_t location_hash(std::string_view host, std::string_view devpath) {
  constexpr uint64_t k_offset = 0xcbf29ce484222325ULL;
  constexpr uint64_t k_prime = 0x100000001b3ULL;
  uint64_t hash = k_offset;
  auto mix = [&hash](unsigned char c) {
    hash ^= c;
    hash *= k_prime;
  };
  for (unsigned char c : host) {
    mix(c);
  }
  mix(0);
  for (unsigned char c : devpath) {
    mix(c);
  }
  return hash;
}

uint16_t tcp_port_for(std::string_view host, std::string_view devpath, uint16_t base, uint16_t span) {
  if (span == 0) {
    return base;
  }
  return static_cast<uint16_t>(base + location_hash(host, devpath) % span);
}

std::optional<notify_event> parse_notify_line(std::string_view line) {
  auto words = split_words(line);
  if (words.size() < 4) {
    return std::nullopt;
  }

  notify_event event;
  if (words[1] == "add") {
    event.action = notify_action::add;
  } else if (words[1] == "remove") {
    event.action = notify_action::remove;
  } else {
    return std::nullopt;
  }

  event.device.board = std::string(words[0]);
  event.device.host = std::string(words[2]);
  event.device.tty = std::string(words[3]);
  size_t next = 4;
  if (next < words.size() && words[next] != "app") {
    event.device.devpath = std::string(words[next]);
    ++next;
  }
  if (next < words.size()) {
    if (words[next] != "app") {
      return std::nullopt;
    }
    event.device.app_running = true;
    ++next;
  }
  if (next != words.size()) {
    return std::nullopt;
  }
  return event;
}

std::optional<syslog_tty> parse_syslog_tty_acm(std::string_view line) {
  static const std::regex pattern("cdc_acm (.*): (ttyACM\\d+): USB ACM device");
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(line.begin(), line.end(), match, pattern)) {
    return std::nullopt;
  }
  return syslog_tty{match[1].str(), match[2].str()};
}

} // namespace gdbhub
