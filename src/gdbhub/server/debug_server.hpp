#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

#include "gdbhub/device/identity.hpp"
#include "gdbhub/protocol/rsp_core.hpp"
#include "gdbhub/transport/transport.hpp"

namespace gdbhub {

class device_actor;

// Looks up the actor currently serving a device. A session is bound to the
// identity rather than to one actor instance, so it survives device restarts.
using device_resolver = std::function<std::shared_ptr<device_actor>(const device_id&)>;

// GDB remote access for one device: every accepted connection runs its own
// blocking request/reply loop.
class debug_server {
public:
  debug_server(device_id id,
               device_resolver resolver,
               std::chrono::milliseconds dispatch_timeout,
               std::unique_ptr<listener> listener);
  ~debug_server();

  debug_server(const debug_server&) = delete;
  debug_server& operator=(const debug_server&) = delete;

  bool listen(std::string_view address);
  void start();
  void stop();

  bool running() const { return running_.load(); }
  std::optional<uint16_t> local_port() const;
  size_t session_count() const;

private:
  struct session {
    std::unique_ptr<transport> conn;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void accept_loop();
  void serve(session& client);
  bool read_request(transport& conn, rsp::assembler& parser, std::string& request);
  bool write_reply(transport& conn, std::string_view reply);
  void reap_sessions(bool all);

  device_id id_;
  device_resolver resolver_;
  std::chrono::milliseconds dispatch_timeout_;
  std::unique_ptr<listener> listener_;

  std::atomic<bool> running_{false};
  std::thread accept_thread_;
  mutable std::mutex sessions_mutex_;
  std::list<session> sessions_;
};

} // namespace gdbhub
