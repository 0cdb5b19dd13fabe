#include "gdbhub/hub/hub.hpp"

#include <fmt/core.h>

#include "gdbhub/log.hpp"

namespace gdbhub {

namespace {

constexpr auto k_idle = std::chrono::milliseconds(500);

} // namespace

hub::hub(hub_config config, bridge_spawner& spawner) : config_(std::move(config)), spawner_(spawner) {}

hub::~hub() { stop(); }

void hub::start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

void hub::stop() {
  if (!thread_.joinable()) {
    return;
  }
  mailbox_.post(stop_request{});
  thread_.join();
}

void hub::set_up_hook(up_hook hook) { mailbox_.post(set_up_hook_request{std::move(hook)}); }

void hub::set_default_handler(packet_handler handler) { default_handler_ = std::move(handler); }

void hub::attach(attach_notification device) { mailbox_.post(attach_request{std::move(device)}); }

void hub::remove(attach_notification device) { mailbox_.post(remove_request{std::move(device)}); }

void hub::notify(notify_event event) {
  switch (event.action) {
  case notify_action::add:
    attach(std::move(event.device));
    break;
  case notify_action::remove:
    remove(std::move(event.device));
    break;
  }
}

bool hub::notify_line(std::string_view line) {
  auto event = parse_notify_line(line);
  if (!event) {
    log::warn("bad notification: {}", log::printable(line));
    return false;
  }
  notify(std::move(*event));
  return true;
}

std::shared_ptr<device_actor> hub::resolve(const device_id& id) {
  if (on_hub_thread()) {
    auto it = devices_.find(id);
    return it == devices_.end() ? nullptr : it->second;
  }
  auto reply = std::make_shared<std::promise<std::shared_ptr<device_actor>>>();
  auto future = reply->get_future();
  if (!mailbox_.post(resolve_request{id, reply})) {
    return nullptr;
  }
  if (future.wait_for(config_.hub_call_timeout) != std::future_status::ready) {
    log::warn("hub call timed out resolving {}", id.str());
    return nullptr;
  }
  return future.get();
}

hub::entry_list hub::entries() {
  if (on_hub_thread()) {
    return entry_list(devices_.begin(), devices_.end());
  }
  auto reply = std::make_shared<std::promise<entry_list>>();
  auto future = reply->get_future();
  if (!mailbox_.post(list_request{reply})) {
    return {};
  }
  if (future.wait_for(config_.hub_call_timeout) != std::future_status::ready) {
    log::warn("hub call timed out listing devices");
    return {};
  }
  return future.get();
}

std::vector<device_id> hub::devices() {
  std::vector<device_id> ids;
  for (auto& entry : entries()) {
    ids.push_back(std::move(entry.first));
  }
  return ids;
}

std::vector<std::shared_ptr<device_actor>> hub::actors() {
  std::vector<std::shared_ptr<device_actor>> out;
  for (auto& entry : entries()) {
    out.push_back(std::move(entry.second));
  }
  return out;
}

// Asks every actor from the calling thread; the hub thread never blocks on
// an actor.
std::map<std::string, std::shared_ptr<device_actor>> hub::uids() {
  std::map<std::string, std::shared_ptr<device_actor>> out;
  for (auto& actor : actors()) {
    auto record = actor->dump(config_.hub_call_timeout);
    if (record && record->uid) {
      out.emplace(*record->uid, actor);
    }
  }
  return out;
}

std::shared_ptr<device_actor> hub::find_uid(const std::string& uid) {
  auto all = uids();
  auto it = all.find(uid);
  return it == all.end() ? nullptr : it->second;
}

std::optional<device_record> hub::info(const device_id& id) {
  auto actor = resolve(id);
  if (!actor) {
    return std::nullopt;
  }
  return actor->dump(config_.hub_call_timeout);
}

void hub::run() {
  hub_thread_ = std::this_thread::get_id();
  log::set_context("hub");
  while (!stopping_) {
    if (auto msg = mailbox_.pop(k_idle)) {
      std::visit([this](auto& m) { handle(m); }, *msg);
    }
  }
  shutdown();
}

void hub::handle(attach_request& msg) {
  const auto& device = msg.device;
  log::info("add_tty {} {} {} {}{}", device.board, device.host, device.tty, device.devpath,
            device.app_running ? " app" : "");

  auto id = resolve_identity(device);
  if (auto it = devices_.find(id); it != devices_.end()) {
    log::info("already have {}", id.str());
    return;
  }

  const auto& location = device.devpath.empty() ? device.tty : device.devpath;
  device_info info{
      .id = id,
      .tty = device.tty,
      .devpath = device.devpath,
      .tcp_port = tcp_port_for(device.host, location, config_.port_base, config_.port_span),
      .app_running = device.app_running,
  };

  device_hooks hooks{
      .on_up = [this](const std::shared_ptr<device_actor>& actor) { mailbox_.post(actor_up{actor}); },
      .on_exit =
          [this](const device_actor& actor, const std::string& reason) {
            mailbox_.post(actor_down{actor.id(), &actor, reason});
          },
      .resolver = [this](const device_id& key) { return resolve(key); },
      .default_handler = default_handler_,
  };

  log::info("adding {} on TCP port {}", id.str(), info.tcp_port);
  devices_.emplace(id, device_actor::start(std::move(info), config_, spawner_, std::move(hooks)));
}

void hub::handle(remove_request& msg) {
  auto id = resolve_identity(msg.device);
  auto it = devices_.find(id);
  if (it == devices_.end()) {
    log::info("remove: {} not registered", id.str());
    return;
  }
  log::info("removing {}", id.str());
  it->second->stop("removed");
}

// Liveness watch: the entry goes away with its actor.
void hub::handle(actor_down& msg) {
  auto it = devices_.find(msg.id);
  if (it == devices_.end() || it->second.get() != msg.actor) {
    log::warn("{} not registered ({})", msg.id.str(), msg.reason);
    return;
  }
  log::info("down {}: {}", msg.id.str(), msg.reason);
  devices_.erase(it);
}

void hub::handle(actor_up& msg) {
  log::info("up {}", msg.actor->id().str());
  if (up_hook_) {
    up_hook_(msg.actor);
  }
}

void hub::handle(resolve_request& msg) {
  auto it = devices_.find(msg.id);
  msg.reply->set_value(it == devices_.end() ? nullptr : it->second);
}

void hub::handle(list_request& msg) {
  entry_list out(devices_.begin(), devices_.end());
  msg.reply->set_value(std::move(out));
}

void hub::handle(set_up_hook_request& msg) { up_hook_ = std::move(msg.hook); }

void hub::handle(stop_request&) { stopping_ = true; }

void hub::shutdown() {
  mailbox_.close();
  for (auto& msg : mailbox_.drain()) {
    if (auto* request = std::get_if<resolve_request>(&msg)) {
      request->reply->set_value(nullptr);
    } else if (auto* request = std::get_if<list_request>(&msg)) {
      request->reply->set_value(entry_list{});
    }
  }

  for (auto& [id, actor] : devices_) {
    actor->stop("hub stopped");
  }
  for (auto& [id, actor] : devices_) {
    actor->exited().wait();
  }
  devices_.clear();
  log::info("stopped");
}

} // namespace gdbhub
