#include "gdbhub/server/debug_server.hpp"

#include <array>
#include <iterator>
#include <span>
#include <string>

#include <fmt/core.h>

#include "gdbhub/device/device.hpp"
#include "gdbhub/log.hpp"

namespace gdbhub {

namespace {

constexpr auto k_poll_interval = std::chrono::milliseconds(100);
constexpr size_t k_read_chunk = 4096;

} // namespace

debug_server::debug_server(device_id id,
                           device_resolver resolver,
                           std::chrono::milliseconds dispatch_timeout,
                           std::unique_ptr<listener> listener)
    : id_(std::move(id)), resolver_(std::move(resolver)), dispatch_timeout_(dispatch_timeout),
      listener_(std::move(listener)) {}

debug_server::~debug_server() { stop(); }

bool debug_server::listen(std::string_view address) { return listener_->listen(address); }

void debug_server::start() {
  if (running_.exchange(true)) {
    return;
  }
  accept_thread_ = std::thread([this] { accept_loop(); });
}

void debug_server::stop() {
  running_ = false;
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  reap_sessions(true);
  listener_->close();
}

std::optional<uint16_t> debug_server::local_port() const { return listener_->local_port(); }

size_t debug_server::session_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  size_t count = 0;
  for (const auto& client : sessions_) {
    if (!client.done) {
      ++count;
    }
  }
  return count;
}

void debug_server::accept_loop() {
  log::set_context(fmt::format("{{gdb_serv,{}}}", id_.str()));
  if (auto port = listener_->local_port()) {
    log::info("GDB remote access on TCP port {}", *port);
  }

  while (running_) {
    reap_sessions(false);
    auto conn = listener_->accept(k_poll_interval);
    if (!conn) {
      continue;
    }

    log::info("connection from {}", conn->peer_name());
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto& client = sessions_.emplace_back();
    client.conn = std::move(conn);
    client.thread = std::thread([this, &client] { serve(client); });
  }
}

void debug_server::serve(session& client) {
  log::set_context(fmt::format("{{gdb_conn,{}}}", id_.str()));
  auto& conn = *client.conn;
  rsp::assembler parser;
  std::string request;

  while (running_ && read_request(conn, parser, request)) {
    log::debug("request: {}", log::printable(request));

    auto actor = resolver_ ? resolver_(id_) : nullptr;
    if (!actor) {
      log::warn("no device for {}, dropping connection", id_.str());
      break;
    }

    auto result = actor->rsp_call(std::move(request), dispatch_timeout_);
    if (!result.ok()) {
      log::warn("call failed ({}), dropping connection", to_string(result.status));
      break;
    }
    if (result.reply.empty()) {
      continue;
    }

    log::debug("reply: {}", log::printable(result.reply));
    if (!write_reply(conn, result.reply)) {
      break;
    }
  }

  conn.close();
  log::info("connection closed");
  client.done = true;
}

bool debug_server::read_request(transport& conn, rsp::assembler& parser, std::string& request) {
  std::array<std::byte, k_read_chunk> buffer{};
  while (running_) {
    if (!conn.readable(k_poll_interval)) {
      continue;
    }

    auto bytes_read = conn.read(buffer);
    if (bytes_read <= 0) {
      return false;
    }

    std::string_view chunk(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(bytes_read));
    if (parser.append(chunk)) {
      request = parser.take();
      return true;
    }
  }
  return false;
}

bool debug_server::write_reply(transport& conn, std::string_view reply) {
  auto bytes = std::as_bytes(std::span<const char>(reply.data(), reply.size()));
  while (!bytes.empty()) {
    auto written = conn.write(bytes);
    if (written <= 0) {
      return false;
    }
    bytes = bytes.subspan(static_cast<size_t>(written));
  }
  return true;
}

void debug_server::reap_sessions(bool all) {
  std::list<session> finished;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      auto next = std::next(it);
      if (all || it->done) {
        finished.splice(finished.end(), sessions_, it);
      }
      it = next;
    }
  }
  for (auto& client : finished) {
    if (client.thread.joinable()) {
      client.thread.join();
    }
  }
}

} // namespace gdbhub
