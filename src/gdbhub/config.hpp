#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace gdbhub {

struct hub_config {
  // Bridge process started per device, given the tty path as its only argument.
  std::string spawn_command = "gdbstub_connect";
  // Used to reach devices attached to another host.
  std::string remote_shell = "ssh";
  // Name of this host; empty means gethostname().
  std::string local_host;

  std::string bind_host = "0.0.0.0";
  uint16_t port_base = 10000;
  uint16_t port_span = 16384;
  bool start_servers = true;

  std::chrono::milliseconds metadata_timeout{6001};
  std::chrono::milliseconds dispatch_timeout{6002};
  std::chrono::milliseconds hub_call_timeout{6003};
  std::chrono::milliseconds boot_reply_timeout{6004};
  std::chrono::milliseconds app_reply_timeout{6005};
  std::chrono::milliseconds ping_timeout{6006};
};

} // namespace gdbhub
