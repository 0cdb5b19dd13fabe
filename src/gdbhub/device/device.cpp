#include "gdbhub/device/device.hpp"

#include <fmt/core.h>

#include "gdbhub/log.hpp"
#include "gdbhub/transport/transport_tcp.hpp"

namespace gdbhub {

namespace {

// Upper bound on how long the actor sleeps between deadline checks.
constexpr auto k_tick = std::chrono::milliseconds(20);
// Extra wait on the caller side; the actor answers every waiter by its deadline.
constexpr auto k_grace = std::chrono::milliseconds(250);

std::string listen_address(const std::string& host, uint16_t port) {
  if (host.find(':') != std::string::npos) {
    return fmt::format("[{}]:{}", host, port);
  }
  return fmt::format("{}:{}", host, port);
}

} // namespace

std::string_view to_string(device_mode mode) {
  switch (mode) {
  case device_mode::bootloader:
    return "bootloader";
  case device_mode::application:
    return "application";
  }
  return "unknown";
}

std::string_view to_string(device_state state) {
  switch (state) {
  case device_state::discovered:
    return "discovered";
  case device_state::connecting:
    return "connecting";
  case device_state::awaiting_metadata:
    return "awaiting_metadata";
  case device_state::ready:
    return "ready";
  case device_state::terminated:
    return "terminated";
  }
  return "unknown";
}

std::string_view to_string(call_status status) {
  switch (status) {
  case call_status::ok:
    return "ok";
  case call_status::timeout:
    return "timeout";
  case call_status::terminated:
    return "terminated";
  case call_status::error:
    return "error";
  }
  return "unknown";
}

device_actor::device_actor(device_info info, hub_config config, bridge_spawner& spawner, device_hooks hooks)
    : info_(std::move(info)), config_(std::move(config)), spawner_(spawner), hooks_(std::move(hooks)),
      exited_(exit_promise_.get_future().share()) {
  if (info_.app_running) {
    // A running application is assumed to speak SLIP with tagged frames.
    decoder_ = framing::decoder(framing::slip_family{});
    encoder_ = framing::encoder(framing::slip_family{});
    mode_ = device_mode::application;
  }
}

device_actor::~device_actor() {
  if (thread_.joinable()) {
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      stop("destroyed");
      thread_.join();
    }
  }
}

std::shared_ptr<device_actor> device_actor::start(device_info info,
                                                  hub_config config,
                                                  bridge_spawner& spawner,
                                                  device_hooks hooks) {
  std::shared_ptr<device_actor> actor(
      new device_actor(std::move(info), std::move(config), spawner, std::move(hooks)));
  // The thread keeps the actor alive until it has terminated.
  actor->thread_ = std::thread([self = actor] { self->run(); });
  return actor;
}

bool device_actor::post(message msg) { return mailbox_.post(std::move(msg)); }

call_result device_actor::await(std::future<call_result> future, std::chrono::milliseconds timeout) {
  if (future.wait_for(timeout + k_grace) != std::future_status::ready) {
    return call_result::timed_out();
  }
  try {
    return future.get();
  } catch (const std::future_error&) {
    return call_result::gone();
  }
}

call_result device_actor::rsp_call(std::string request, std::chrono::milliseconds timeout) {
  auto reply = std::make_shared<std::promise<call_result>>();
  auto future = reply->get_future();
  if (!post(rsp_call_request{std::move(request), reply, clock::now() + timeout})) {
    return call_result::gone();
  }
  return await(std::move(future), timeout);
}

call_result device_actor::call(std::string payload, std::chrono::milliseconds timeout, uint16_t tag) {
  auto reply = std::make_shared<std::promise<call_result>>();
  auto future = reply->get_future();
  if (!post(call_request{std::move(payload), tag, reply, clock::now() + timeout})) {
    return call_result::gone();
  }
  return await(std::move(future), timeout);
}

bool device_actor::ping(std::chrono::milliseconds timeout) {
  auto result = call({}, timeout, tags::ping);
  return result.ok() && result.reply.empty();
}

void device_actor::send(std::string data) { post(send_raw{std::move(data)}); }

void device_actor::send_packet(std::string frame) { post(send_frame{std::move(frame)}); }

void device_actor::send_term(term::value term) { post(send_term_request{std::move(term)}); }

void device_actor::set_peer(std::weak_ptr<device_actor> peer) { post(set_peer_request{std::move(peer)}); }

void device_actor::set_forward(packet_handler handler) { post(set_forward_request{std::move(handler)}); }

void device_actor::set_name(std::string name) { post(set_name_request{std::move(name)}); }

std::optional<device_record> device_actor::dump(std::chrono::milliseconds timeout) {
  auto reply = std::make_shared<std::promise<device_record>>();
  auto future = reply->get_future();
  if (!post(dump_request{reply})) {
    return std::nullopt;
  }
  if (future.wait_for(timeout) != std::future_status::ready) {
    return std::nullopt;
  }
  try {
    return future.get();
  } catch (const std::future_error&) {
    return std::nullopt;
  }
}

void device_actor::stop(std::string reason) { post(stop_request{std::move(reason)}); }

void link_peers(const std::shared_ptr<device_actor>& a, const std::shared_ptr<device_actor>& b) {
  a->set_peer(b);
  b->set_peer(a);
}

void device_actor::run() {
  log::set_context(fmt::format("{{{},{}}}", info_.id.host, info_.tty));
  std::string reason = "normal";
  try {
    connect();
    while (true) {
      if (auto msg = mailbox_.pop(k_tick)) {
        std::visit([this](auto& m) { handle(m); }, *msg);
      }
      expire_waiters();
    }
  } catch (const actor_exit& e) {
    reason = e.what();
  }
  shutdown(reason);
}

void device_actor::connect() {
  state_ = device_state::connecting;
  log::info("connecting...");

  bridge_ = spawner_.spawn(spawn_request{info_.id.host, config_.spawn_command, {info_.tty}});
  if (!bridge_) {
    log::error("cannot start {} on {}", config_.spawn_command, info_.id.host);
    throw actor_exit("bridge spawn failed");
  }

  bridge_->start(bridge_events{
      .on_data = [this](std::string data) { post(bridge_data{std::move(data)}); },
      .on_exit = [this](int status) { post(bridge_exit{status}); },
  });
  log::info("connected, mode {}", to_string(mode()));

  state_ = device_state::awaiting_metadata;
  start_metadata_query();
}

void device_actor::start_metadata_query() {
  meta_thread_ = std::thread([this] {
    log::set_context(fmt::format("{{meta,{},{}}}", info_.id.host, info_.tty));
    log::info("getting meta info");

    set_meta meta;
    meta.uid = query_monitor("uid");
    if (meta.uid) {
      meta.protocol = query_monitor("protocol");
    }
    if (meta.protocol) {
      meta.protocol2 = query_monitor("protocol2");
    }
    meta.negotiated = meta.uid && meta.protocol && meta.protocol2;
    if (meta.negotiated) {
      log::info("got meta info");
    } else {
      log::warn("error getting meta info, continuing without");
    }
    post(std::move(meta));
  });
}

std::optional<std::string> device_actor::query_monitor(std::string_view command) {
  auto request = rsp::wrap(fmt::format("qRcmd,{}", rsp::encode_hex(command)));
  auto result = rsp_call(std::move(request), config_.metadata_timeout);
  if (!result.ok()) {
    log::warn("monitor {}: {}", command, to_string(result.status));
    return std::nullopt;
  }
  auto text = rsp::unwrap(result.reply);
  if (auto decoded = rsp::decode_hex(text)) {
    return decoded;
  }
  return text;
}

void device_actor::start_server() {
  if (!config_.start_servers || server_) {
    return;
  }

  auto resolver = hooks_.resolver;
  if (!resolver) {
    resolver = [weak = weak_from_this()](const device_id&) { return weak.lock(); };
  }

  auto server = std::make_unique<debug_server>(info_.id, std::move(resolver), config_.dispatch_timeout,
                                               std::make_unique<tcp_listener>());
  auto address = listen_address(config_.bind_host, info_.tcp_port);
  if (!server->listen(address)) {
    log::error("cannot listen on {}", address);
    return;
  }
  server->start();
  server_ = std::move(server);
}

void device_actor::handle(set_meta& msg) {
  if (meta_thread_.joinable()) {
    meta_thread_.join();
  }

  if (msg.negotiated) {
    uid_ = msg.uid;
    auto encode_family = framing::parse_family_or_raw(*msg.protocol);
    auto decode_family =
        *msg.protocol2 == "unknown" ? encode_family : framing::parse_family_or_raw(*msg.protocol2);
    decoder_ = framing::decoder(decode_family);
    encoder_ = framing::encoder(encode_family);
    log::info("uid {}, decode {}, encode {}", *uid_, framing::describe(decode_family),
              framing::describe(encode_family));
  }

  state_ = device_state::ready;
  start_server();
  if (hooks_.on_up) {
    hooks_.on_up(shared_from_this());
  }
}

void device_actor::handle(set_peer_request& msg) { peer_ = std::move(msg.peer); }

void device_actor::handle(set_forward_request& msg) { forward_ = std::move(msg.handler); }

void device_actor::handle(set_name_request& msg) {
  log::info("name {}", msg.name);
  name_ = std::move(msg.name);
}

void device_actor::handle(dump_request& msg) { msg.reply->set_value(snapshot()); }

void device_actor::handle(stop_request& msg) { throw actor_exit(msg.reason); }

device_record device_actor::snapshot() const {
  device_record record;
  record.id = info_.id;
  record.tty = info_.tty;
  record.devpath = info_.devpath;
  record.tcp_port = info_.tcp_port;
  record.state = state_.load();
  record.mode = mode_.load();
  record.uid = uid_;
  record.name = name_;
  record.decode_protocol = framing::describe(decoder_.source());
  record.encode_protocol = framing::describe(encoder_.source());
  record.rest_size = rest_.size();
  record.line_buffer = line_buffer_;
  record.pending_calls = calls_.size();
  record.debug_call_pending = boot_waiter_.has_value() || app_waiter_.has_value();
  record.has_peer = !peer_.expired();
  record.has_forward = static_cast<bool>(forward_);
  if (server_) {
    record.server_port = server_->local_port();
  }
  return record;
}

void device_actor::shutdown(const std::string& reason) {
  state_ = device_state::terminated;
  mailbox_.close();

  for (auto& msg : mailbox_.drain()) {
    if (auto* request = std::get_if<rsp_call_request>(&msg)) {
      request->reply->set_value(call_result::gone());
    } else if (auto* request = std::get_if<call_request>(&msg)) {
      request->reply->set_value(call_result::gone());
    }
  }
  if (boot_waiter_) {
    boot_waiter_->reply->set_value(call_result::gone());
    boot_waiter_.reset();
  }
  if (app_waiter_) {
    app_waiter_->reply->set_value(call_result::gone());
    app_waiter_->chunks->close();
    if (app_waiter_->helper.joinable()) {
      app_waiter_->helper.join();
    }
    app_waiter_.reset();
  }
  calls_.erase_if([](rpc::token, pending_call& pending) {
    pending.reply->set_value(call_result::gone());
    return true;
  });

  server_.reset();
  if (bridge_) {
    bridge_->close();
    bridge_.reset();
  }
  if (meta_thread_.joinable()) {
    meta_thread_.join();
  }

  log::info("terminated: {}", reason);
  if (hooks_.on_exit) {
    hooks_.on_exit(*this, reason);
  }
  exit_promise_.set_value(reason);
}

} // namespace gdbhub
