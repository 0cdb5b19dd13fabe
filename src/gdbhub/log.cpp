#include "gdbhub/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace gdbhub::log {

namespace {

std::atomic<level> g_level{level::info};
std::mutex g_sink_mutex;
sink g_sink;

thread_local std::string t_context;

void write_stderr(level lvl, std::string_view line) {
  fmt::print(stderr, "[{}] {}\n", level_name(lvl), line);
  std::fflush(stderr);
}

} // namespace

void set_level(level min_level) { g_level.store(min_level); }

level current_level() { return g_level.load(); }

bool enabled(level lvl) { return static_cast<int>(lvl) >= static_cast<int>(g_level.load()); }

void set_sink(sink out) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = std::move(out);
}

void set_context(std::string name) { t_context = std::move(name); }

const std::string& context() { return t_context; }

void write(level lvl, std::string_view message) {
  while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
    message.remove_suffix(1);
  }

  std::string line;
  if (t_context.empty()) {
    line.assign(message.data(), message.size());
  } else {
    line = fmt::format("{}: {}", t_context, message);
  }

  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if (g_sink) {
    g_sink(lvl, line);
  } else {
    write_stderr(lvl, line);
  }
}

std::string_view level_name(level lvl) {
  switch (lvl) {
  case level::debug:
    return "debug";
  case level::info:
    return "info";
  case level::warn:
    return "warn";
  case level::error:
    return "error";
  }
  return "info";
}

std::optional<level> parse_level(std::string_view text) {
  if (text == "debug") {
    return level::debug;
  }
  if (text == "info") {
    return level::info;
  }
  if (text == "warn" || text == "warning") {
    return level::warn;
  }
  if (text == "error") {
    return level::error;
  }
  return std::nullopt;
}

std::string printable(std::string_view data) {
  std::string out;
  out.reserve(data.size());
  for (unsigned char c : data) {
    if (c >= 0x20 && c < 0x7f && c != '\\') {
      out.push_back(static_cast<char>(c));
    } else if (c == '\\') {
      out += "\\\\";
    } else {
      out += fmt::format("\\x{:02x}", c);
    }
  }
  return out;
}

} // namespace gdbhub::log
