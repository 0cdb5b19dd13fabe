#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace gdbhub::log {

enum class level { debug, info, warn, error };

// Receives one formatted line, without trailing newline.
using sink = std::function<void(level, std::string_view)>;

void set_level(level min_level);
level current_level();
bool enabled(level lvl);

// An empty sink restores the default stderr writer.
void set_sink(sink out);

// Per-thread name prefixed to every line written from that thread.
void set_context(std::string name);
const std::string& context();

void write(level lvl, std::string_view message);

std::string_view level_name(level lvl);
std::optional<level> parse_level(std::string_view text);

// Printable rendering of binary data: printable ASCII kept, the rest as \xNN.
std::string printable(std::string_view data);

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(level::debug)) {
    write(level::debug, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(level::info)) {
    write(level::info, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(level::warn)) {
    write(level::warn, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(level::error)) {
    write(level::error, fmt::format(format, std::forward<Args>(args)...));
  }
}

} // namespace gdbhub::log
