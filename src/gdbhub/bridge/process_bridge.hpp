#pragma once

#include <memory>
#include <string>

#include "gdbhub/bridge/bridge.hpp"

namespace gdbhub {

// Starts the bridge as a child process talking over its stdin/stdout. Devices
// on another host are reached through the remote shell.
class process_spawner final : public bridge_spawner {
public:
  process_spawner(std::string local_host, std::string remote_shell);

  std::unique_ptr<bridge_channel> spawn(const spawn_request& request) override;

  const std::string& local_host() const { return local_host_; }

private:
  std::string local_host_;
  std::string remote_shell_;

  bool is_local(const std::string& host) const;
};

std::string local_host_name();

} // namespace gdbhub
