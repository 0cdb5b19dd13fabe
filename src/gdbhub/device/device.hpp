#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

#include "gdbhub/actor/mailbox.hpp"
#include "gdbhub/bridge/bridge.hpp"
#include "gdbhub/config.hpp"
#include "gdbhub/device/identity.hpp"
#include "gdbhub/protocol/framing.hpp"
#include "gdbhub/protocol/rsp_core.hpp"
#include "gdbhub/protocol/tags.hpp"
#include "gdbhub/protocol/term.hpp"
#include "gdbhub/rpc/correlation_table.hpp"
#include "gdbhub/server/debug_server.hpp"

namespace gdbhub {

enum class device_mode { bootloader, application };

enum class device_state { discovered, connecting, awaiting_metadata, ready, terminated };

// error: the request could not be framed for the device.
enum class call_status { ok, timeout, terminated, error };

std::string_view to_string(device_mode mode);
std::string_view to_string(device_state state);
std::string_view to_string(call_status status);

struct call_result {
  call_status status = call_status::ok;
  std::string reply;

  bool ok() const { return status == call_status::ok; }

  static call_result success(std::string value) { return {call_status::ok, std::move(value)}; }
  static call_result timed_out() { return {call_status::timeout, {}}; }
  static call_result gone() { return {call_status::terminated, {}}; }
  static call_result failed() { return {call_status::error, {}}; }
};

struct device_info {
  device_id id;
  std::string tty;
  std::string devpath;
  uint16_t tcp_port = 0;
  bool app_running = false;
};

// Snapshot of the actor state, for diagnostics.
struct device_record {
  device_id id;
  std::string tty;
  std::string devpath;
  uint16_t tcp_port = 0;
  device_state state = device_state::discovered;
  device_mode mode = device_mode::bootloader;
  std::optional<std::string> uid;
  std::optional<std::string> name;
  std::string decode_protocol;
  std::string encode_protocol;
  size_t rest_size = 0;
  std::string line_buffer;
  size_t pending_calls = 0;
  bool debug_call_pending = false;
  bool has_peer = false;
  bool has_forward = false;
  std::optional<uint16_t> server_port;
};

// Ends the actor loop; the message is the termination reason.
class actor_exit : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class device_actor;

// Receives frames that no sub-channel consumed.
using packet_handler = std::function<void(device_actor&, std::string_view frame)>;

struct device_hooks {
  // Metadata negotiation finished, successfully or not.
  std::function<void(const std::shared_ptr<device_actor>&)> on_up;
  // Liveness watch: called once from the actor thread as it terminates.
  std::function<void(const device_actor&, const std::string& reason)> on_exit;
  // Used by the debug server to find the current actor for this identity.
  device_resolver resolver;
  packet_handler default_handler;
};

class device_actor : public std::enable_shared_from_this<device_actor> {
public:
  ~device_actor();

  device_actor(const device_actor&) = delete;
  device_actor& operator=(const device_actor&) = delete;

  static std::shared_ptr<device_actor> start(device_info info,
                                             hub_config config,
                                             bridge_spawner& spawner,
                                             device_hooks hooks);

  const device_id& id() const { return info_.id; }
  const device_info& info() const { return info_; }
  uint16_t tcp_port() const { return info_.tcp_port; }
  device_mode mode() const { return mode_.load(); }
  device_state state() const { return state_.load(); }
  bool alive() const { return state_.load() != device_state::terminated; }

  // Ready with the termination reason once the actor thread has finished.
  std::shared_future<std::string> exited() const { return exited_; }

  // Debug request in the style of the current mode: raw pass-through in the
  // boot loader, tagged and asynchronous once the application runs.
  call_result rsp_call(std::string request, std::chrono::milliseconds timeout);

  // Correlated call: tag + payload + ack, answered by a reply-tagged frame.
  call_result call(std::string payload, std::chrono::milliseconds timeout, uint16_t tag = tags::gdb);

  bool ping(std::chrono::milliseconds timeout);

  // Raw bytes to the bridge. Switches the device to application mode.
  void send(std::string data);
  // Frame through the negotiated encoder.
  void send_packet(std::string frame);
  // Encoded term behind a 4-byte length, written raw whatever the encoder.
  void send_term(term::value term);

  void set_peer(std::weak_ptr<device_actor> peer);
  void set_forward(packet_handler handler);
  void set_name(std::string name);

  std::optional<device_record> dump(std::chrono::milliseconds timeout);

  void stop(std::string reason = "stopped");

private:
  using clock = std::chrono::steady_clock;
  using reply_promise = std::shared_ptr<std::promise<call_result>>;

  struct bridge_data {
    std::string data;
  };
  struct bridge_exit {
    int status = 0;
  };
  struct rsp_call_request {
    std::string request;
    reply_promise reply;
    clock::time_point deadline;
  };
  struct rsp_call_reply {
    uint64_t serial = 0;
    std::optional<std::string> reply;
  };
  struct call_request {
    std::string payload;
    uint16_t tag = tags::gdb;
    reply_promise reply;
    clock::time_point deadline;
  };
  struct send_raw {
    std::string data;
  };
  struct send_frame {
    std::string frame;
  };
  struct send_term_request {
    term::value term;
  };
  struct set_meta {
    bool negotiated = false;
    std::optional<std::string> uid;
    std::optional<std::string> protocol;
    std::optional<std::string> protocol2;
  };
  struct set_peer_request {
    std::weak_ptr<device_actor> peer;
  };
  struct set_forward_request {
    packet_handler handler;
  };
  struct set_name_request {
    std::string name;
  };
  struct dump_request {
    std::shared_ptr<std::promise<device_record>> reply;
  };
  struct stop_request {
    std::string reason;
  };

  using message = std::variant<bridge_data,
                               bridge_exit,
                               rsp_call_request,
                               rsp_call_reply,
                               call_request,
                               send_raw,
                               send_frame,
                               send_term_request,
                               set_meta,
                               set_peer_request,
                               set_forward_request,
                               set_name_request,
                               dump_request,
                               stop_request>;

  // Boot-loader call: reply assembled directly from bridge data.
  struct boot_waiter {
    reply_promise reply;
    clock::time_point deadline;
    rsp::assembler assembler;
  };

  // Application call: a helper thread assembles the reply from gdb frames.
  struct app_waiter {
    uint64_t serial = 0;
    reply_promise reply;
    std::shared_ptr<mailbox<std::string>> chunks;
    std::thread helper;
  };

  struct pending_call {
    reply_promise reply;
    clock::time_point deadline;
  };

  device_actor(device_info info, hub_config config, bridge_spawner& spawner, device_hooks hooks);

  bool post(message msg);
  call_result await(std::future<call_result> future, std::chrono::milliseconds timeout);

  void run();
  void connect();
  void start_metadata_query();
  std::optional<std::string> query_monitor(std::string_view command);
  void start_server();
  void shutdown(const std::string& reason);
  void expire_waiters();

  void handle(bridge_data& msg);
  void handle(bridge_exit& msg);
  void handle(rsp_call_request& msg);
  void handle(rsp_call_reply& msg);
  void handle(call_request& msg);
  void handle(send_raw& msg);
  void handle(send_frame& msg);
  void handle(send_term_request& msg);
  void handle(set_meta& msg);
  void handle(set_peer_request& msg);
  void handle(set_forward_request& msg);
  void handle(set_name_request& msg);
  void handle(dump_request& msg);
  void handle(stop_request& msg);

  void boot_call(rsp_call_request& msg);
  void app_call(rsp_call_request& msg);
  void app_call_helper(uint64_t serial,
                       std::string request,
                       std::shared_ptr<mailbox<std::string>> chunks,
                       std::chrono::milliseconds timeout);

  void write_bridge(std::string_view data);
  void decode_and_handle(std::string_view data);
  void handle_frame(std::string_view frame);
  void handle_gdb(std::string_view body);
  void handle_info(std::string_view body);
  void handle_reply(std::string_view frame);
  void handle_unclaimed(std::string_view frame);
  void print_frame(std::string_view frame);
  bool write_frame(std::string_view frame);
  void switch_to_application();

  device_record snapshot() const;

  device_info info_;
  hub_config config_;
  bridge_spawner& spawner_;
  device_hooks hooks_;

  mailbox<message> mailbox_;
  std::thread thread_;
  std::thread meta_thread_;
  std::promise<std::string> exit_promise_;
  std::shared_future<std::string> exited_;

  std::atomic<device_mode> mode_{device_mode::bootloader};
  std::atomic<device_state> state_{device_state::discovered};

  // Owned by the actor thread.
  std::unique_ptr<bridge_channel> bridge_;
  std::unique_ptr<debug_server> server_;
  framing::decoder decoder_;
  framing::encoder encoder_;
  std::string rest_;
  std::string line_buffer_;
  std::optional<std::string> uid_;
  std::optional<std::string> name_;
  std::optional<boot_waiter> boot_waiter_;
  std::optional<app_waiter> app_waiter_;
  uint64_t next_serial_ = 0;
  rpc::correlation_table<pending_call> calls_;
  std::weak_ptr<device_actor> peer_;
  packet_handler forward_;
};

// Binds two actors as relay partners in both directions.
void link_peers(const std::shared_ptr<device_actor>& a, const std::shared_ptr<device_actor>& b);

} // namespace gdbhub
