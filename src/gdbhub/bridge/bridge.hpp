#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gdbhub {

struct spawn_request {
  std::string host;
  std::string command;
  std::vector<std::string> args;
};

struct bridge_events {
  std::function<void(std::string)> on_data;
  // Exit status of the bridge, or -1 when it could not be collected.
  std::function<void(int)> on_exit;
};

// Duplex byte channel to a device's serial line.
class bridge_channel {
public:
  virtual ~bridge_channel() = default;

  // Events are delivered from another thread until close() returns.
  virtual void start(bridge_events events) = 0;
  virtual bool write(std::string_view data) = 0;
  virtual void close() = 0;
};

class bridge_spawner {
public:
  virtual ~bridge_spawner() = default;

  // Null when the bridge could not be started.
  virtual std::unique_ptr<bridge_channel> spawn(const spawn_request& request) = 0;
};

} // namespace gdbhub
